#include "TD/Data/ExpressionParser.hpp"

#include <tao/pegtl.hpp>

namespace td {

namespace expr {

    namespace pegtl = tao::pegtl;

    struct blanks : pegtl::plus< pegtl::blank > {};

    // A lone '+' or '-' is an operator; "+5" or "-rrb-" are ordinary words
    struct op : pegtl::seq< pegtl::one<'+', '-'>, pegtl::at< pegtl::sor< pegtl::blank, pegtl::eolf > > > {};
    struct word : pegtl::seq< pegtl::not_at< op >, pegtl::plus< pegtl::not_one<' ', '\t', '\r', '\n'> > > {};

    struct sentence : pegtl::list< word, blanks > {};
    struct expression : pegtl::must< pegtl::opt< blanks >, sentence,
                                     pegtl::star< blanks, op, blanks, sentence >,
                                     pegtl::opt< blanks >, pegtl::eof > {};

    struct token : pegtl::plus< pegtl::not_one<' ', '\t', '\r', '\n'> > {};
    struct tokens : pegtl::seq< pegtl::opt< blanks >, pegtl::opt< pegtl::list< token, blanks > >,
                                pegtl::opt< blanks >, pegtl::eof > {};

    struct ExpressionSink {
        ParsedExpression out;
    };

    template< typename Rule > struct action : pegtl::nothing< Rule > {};

    template<> struct action< word > {
        template< typename Input >
        static void apply(const Input& in, ExpressionSink& sink) {
            if (sink.out.terms.empty()) sink.out.terms.emplace_back();
            sink.out.terms.back().push_back(in.string());
        }
    };

    template<> struct action< op > {
        template< typename Input >
        static void apply(const Input& in, ExpressionSink& sink) {
            sink.out.operators.push_back(parseOperator(in.peek_char()));
            sink.out.terms.emplace_back();
        }
    };

    template< typename Rule > struct token_action : pegtl::nothing< Rule > {};

    template<> struct token_action< token > {
        template< typename Input >
        static void apply(const Input& in, std::vector<std::string>& out) {
            out.push_back(in.string());
        }
    };

} // namespace expr

ParsedExpression parseExpression(std::string_view text) {
    namespace pegtl = tao::pegtl;

    pegtl::memory_input in(text.data(), text.size(), "<expression>");
    expr::ExpressionSink sink;
    try {
        pegtl::parse< expr::expression, expr::action >(in, sink);
    } catch (const pegtl::parse_error& e) {
        throw ParseError("malformed expression '" + std::string(text) + "': " + e.what());
    }
    return std::move(sink.out);
}

std::string toString(const ParsedExpression& expression) {
    std::string out;
    for (size_t k = 0; k < expression.terms.size(); ++k) {
        if (k > 0) out += " " + toString(expression.operators.at(k - 1)) + " ";
        for (size_t i = 0; i < expression.terms[k].size(); ++i) {
            if (i > 0) out.push_back(' ');
            out += expression.terms[k][i];
        }
    }
    return out;
}

std::vector<std::string> tokenize(std::string_view text) {
    namespace pegtl = tao::pegtl;

    pegtl::memory_input in(text.data(), text.size(), "<tokens>");
    std::vector<std::string> out;
    if (!pegtl::parse< expr::tokens, expr::token_action >(in, out)) {
        throw ParseError("cannot tokenize '" + std::string(text) + "'");
    }
    return out;
}

} // namespace td
