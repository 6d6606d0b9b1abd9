#ifndef STD_HPP
#define STD_HPP
#include<algorithm>
#include<atomic>
#include<climits>
#include<cstddef>
#include<cstdint>
#include<deque>
#include<functional>
#include<initializer_list>
#include<map>
#include<memory>
#include<mutex>
#include<set>
#include<shared_mutex>
#include<stack>
#include<stdexcept>
#include<string>
#include<string_view>
#include<unordered_map>
#include<unordered_set>
#include<utility>
#include<vector>
#endif // STD_HPP
