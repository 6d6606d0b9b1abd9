#ifndef SLOT_ARENA_HPP
#define SLOT_ARENA_HPP
#include "std.hpp"

// Append-only store addressed by the index assigned at insertion. Entries are
// heap allocated and never move, so a reference handed out stays valid while
// other threads keep appending.
template <typename T>
class SlotArena {
public:
    size_t append(std::unique_ptr<T> item){
        std::unique_lock<std::shared_mutex> guard(lock);
        slots.push_back(std::move(item));
        return slots.size() - 1;
    }

    // Throws std::out_of_range for an index that was never assigned
    T& at(size_t index) const{
        std::shared_lock<std::shared_mutex> guard(lock);
        if (index >= slots.size()){
            throw std::out_of_range("slot " + std::to_string(index) + " not assigned");
        }
        return *slots[index];
    }

    size_t size() const{
        std::shared_lock<std::shared_mutex> guard(lock);
        return slots.size();
    }

private:
    mutable std::shared_mutex lock;
    std::deque<std::unique_ptr<T>> slots;
};

#endif // SLOT_ARENA_HPP
