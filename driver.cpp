#include<iostream>
#include<vector>
#include"atn_builder.hpp"
#include"atn_printer.hpp"
#include"lookahead_analyzer.hpp"
#include<chrono>

// Token types of a small expression language
enum : int { ID = 1, INT, PLUS, STAR, LPAREN, RPAREN, SEMI };

static const std::vector<std::string> vocabulary = {
    "", "ID", "INT", "'+'", "'*'", "'('", "')'", "';'"
};

int main(int argc, char** argv){
    auto start = std::chrono::high_resolution_clock::now();

    // prog   : stat+ ;
    // stat   : expr ';' ;
    // expr   : term ('+' term)* ;
    // term   : factor ('*' factor)* ;
    // factor : ID | INT | '(' expr ')' ;
    Atn atn(GrammarType::PARSER, SEMI);
    AtnBuilder b(atn);
    int prog = b.rule();
    int stat = b.rule();
    int expr = b.rule();
    int term = b.rule();
    int factor = b.rule();

    Frag call_stat = b.rule_ref(prog, stat);
    b.set_rule_body(prog, b.plus(prog, call_stat));

    Frag call_expr = b.rule_ref(stat, expr);
    b.set_rule_body(stat, b.sequence({call_expr, b.atom(stat, SEMI)}));

    Frag call_term = b.rule_ref(expr, term);
    b.set_rule_body(expr, b.sequence({
        call_term,
        b.star(expr, b.sequence({b.atom(expr, PLUS), b.rule_ref(expr, term)}))
    }));

    Frag call_factor = b.rule_ref(term, factor);
    b.set_rule_body(term, b.sequence({
        call_factor,
        b.star(term, b.sequence({b.atom(term, STAR), b.rule_ref(term, factor)}))
    }));

    Frag id = b.atom(factor, ID);
    b.set_rule_body(factor, b.alternatives(factor, {
        id,
        b.atom(factor, INT),
        b.sequence({b.atom(factor, LPAREN), b.rule_ref(factor, expr), b.atom(factor, RPAREN)})
    }));

    std::cout << "states: " << atn.state_count() << ", rules: " << atn.rule_count()
              << ", decisions: " << atn.number_of_decisions() << "\n";

    // 1. lookahead per decision
    LookaheadAnalyzer analyzer(atn);
    for (size_t d = 0; d < atn.number_of_decisions(); d++){
        const State* s = atn.get_decision_state(static_cast<int>(d));
        std::cout << "decision " << d << " (s" << s->state_number << ", " << to_string(s->type) << "):";
        int alt = 1;
        for (const auto& look : analyzer.decision_lookahead(s)){
            std::cout << " alt " << alt++ << "=" << (look ? look->to_string(vocabulary) : "?");
        }
        std::cout << "\n";
    }

    // 2. rule-local follow sets
    for (size_t i = 0; i < atn.state_count(); i++){
        const State* s = atn.get_state(static_cast<int>(i));
        if (!s) continue;
        std::cout << "s" << i << " " << to_string(s->type) << " r" << s->rule_index
                  << ": " << atn.next_tokens(s).to_string(vocabulary) << "\n";
    }

    // 3. expected tokens after an ID, five rules deep
    RuleContext in_prog;
    RuleContext in_stat{&in_prog, call_stat.start->state_number};
    RuleContext in_expr{&in_stat, call_expr.start->state_number};
    RuleContext in_term{&in_expr, call_term.start->state_number};
    RuleContext in_factor{&in_term, call_factor.start->state_number};
    try{
        IntervalSet expected = atn.get_expected_tokens(id.end->state_number, &in_factor);
        std::cout << "expected after ID: " << expected.to_string(vocabulary) << "\n";
        atn.get_expected_tokens(-1, &in_factor);
    }catch (const std::exception& e) {
        std::cout << "ERR: "  << " -> " << e.what() << "\n";
    }

    // 4. render (check results with: dot -Tpng <file>)
    if (argc > 1 && !AtnPrinter::write_dot(atn, argv[1], vocabulary)) return 1;

    auto end = std::chrono::high_resolution_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    std::cout << "Elapsed time: " << elapsed.count() << " us\n";
    return 0;
}
