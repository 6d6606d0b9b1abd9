#ifndef ATN_PRINTER_HPP
#define ATN_PRINTER_HPP
#include <fstream>
#include <iostream>
#include <ostream>
#include "atn.hpp"

// Debugging tools
class AtnPrinter {
public:
    // Writes the whole ATN as a Graphviz digraph. Symbols are labelled from
    // `vocabulary` where it has a name for them.
    static void print_atn(const Atn& atn, std::ostream& out, const std::vector<std::string>& vocabulary = {}) {
        out << "digraph ATN {\n";
        out << "  rankdir=LR;\n";
        out << "  fontname=\"monospace\";\n";
        for (size_t i = 0; i < atn.state_count(); i++) {
            const State* s = atn.get_state(static_cast<int>(i));
            if (s) print_state(s, out, vocabulary);
        }
        out << "}\n";
    }

    // Renders to `dot_file`; returns false if the file cannot be written
    static bool write_dot(const Atn& atn, const std::string& dot_file, const std::vector<std::string>& vocabulary = {}) {
        std::ofstream out(dot_file);
        if (!out) {
            std::cerr << "Failed to open " << dot_file << "\n";
            return false;
        }
        print_atn(atn, out, vocabulary);
        return true;
    }

private:
    static std::string dot_escape(const std::string& text) {
        std::string escaped;
        for (char c : text) {
            if (c == '\\') escaped += "\\\\";
            else if (c == '"') escaped += "\\\"";
            else if (c == '\n') escaped += "\\n";
            else escaped += c;
        }
        return escaped;
    }

    static void print_state(const State* s, std::ostream& out, const std::vector<std::string>& vocabulary) {
        // Node
        out << "  s" << s->state_number << " [label=\"" << s->state_number << "\\n" << to_string(s->type);
        if (s->decision >= 0) out << "\\nd=" << s->decision;
        out << "\"";

        if (s->type == StateType::RULE_START) out << ", shape=doublecircle";
        else if (s->type == StateType::RULE_STOP) out << ", shape=doublecircle color=green";
        else if (s->decision >= 0) out << ", shape=diamond";
        else out << ", shape=circle";

        out << "];\n";

        // Edges
        for (const auto& t : s->transitions) {
            out << "  s" << s->state_number << " -> s" << t.target->state_number
                << " [label=\"" << dot_escape(edge_label(t, vocabulary)) << "\"";
            if (t.is_epsilon()) out << ", style=dashed";
            out << "];\n";
        }
    }

    static std::string edge_label(const Transition& t, const std::vector<std::string>& vocabulary) {
        switch (t.type) {
            case TransitionType::ATOM:
            case TransitionType::RANGE:
            case TransitionType::SET:
                return t.label.to_string(vocabulary);
            case TransitionType::NOT_SET:
                return "~" + t.label.to_string(vocabulary);
            case TransitionType::WILDCARD:
                return ".";
            case TransitionType::RULE:
                return "call " + std::to_string(t.rule_index) + " -> s" + std::to_string(t.follow_state->state_number);
            case TransitionType::PREDICATE:
                return "pred " + std::to_string(t.rule_index) + ":" + std::to_string(t.pred_index) +
                       (t.is_ctx_dependent ? " ctx" : "");
            case TransitionType::PRECEDENCE:
                return "prec " + std::to_string(t.precedence);
            case TransitionType::ACTION:
                return "action " + std::to_string(t.rule_index) + ":" + std::to_string(t.action_index) +
                       (t.is_ctx_dependent ? " ctx" : "");
            case TransitionType::EPSILON:
                return "ε";
            default:
                return "";
        }
    }
};

#endif // ATN_PRINTER_HPP
