#include "TD/Config.hpp"

#include <tao/pegtl.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <functional>
#include <regex>
#include <sstream>

namespace td {

namespace cfg {

    namespace pegtl = tao::pegtl;

    // Whitespace and comments
    struct ws : pegtl::star< pegtl::blank > {};
    struct comment : pegtl::seq< pegtl::one<'#', ';'>, pegtl::star< pegtl::not_one<'\n'> > > {};

    // [section]
    struct name : pegtl::plus< pegtl::sor< pegtl::alnum, pegtl::one<'_', '.', '-'> > > {};
    struct section_name : name {};
    struct section : pegtl::seq< pegtl::one<'['>, ws, section_name, ws, pegtl::one<']'> > {};

    // key = value
    struct key : name {};
    struct value : pegtl::star< pegtl::not_one<'\r', '\n', '#', ';'> > {};
    struct entry : pegtl::seq< key, ws, pegtl::one<'='>, ws, value > {};

    struct line : pegtl::seq< ws, pegtl::opt< pegtl::sor< section, entry > >, ws, pegtl::opt< comment > > {};
    struct grammar : pegtl::must< pegtl::list< line, pegtl::eol >, pegtl::eof > {};

    struct State {
        ConfigSections sections;
        std::string section;
        std::string key;
        std::string source;
    };

    template< typename Rule > struct action : pegtl::nothing< Rule > {};

    template<> struct action< section_name > {
        template< typename Input >
        static void apply(const Input& in, State& st) {
            st.section = in.string();
            st.sections[st.section];
        }
    };

    template<> struct action< key > {
        template< typename Input >
        static void apply(const Input& in, State& st) {
            st.key = in.string();
        }
    };

    template<> struct action< value > {
        template< typename Input >
        static void apply(const Input& in, State& st) {
            std::string v = in.string();
            while (!v.empty() && std::isspace(static_cast<unsigned char>(v.back()))) v.pop_back();

            auto& entries = st.sections[st.section];
            if (entries.count(st.key)) {
                std::ostringstream oss;
                oss << st.source << ":" << in.position().line << ": duplicate key '"
                    << (st.section.empty() ? "" : st.section + ".") << st.key << "'";
                throw ConfigError(oss.str());
            }
            entries[st.key] = std::move(v);
        }
    };

    static bool parseBool(const std::string& where, const std::string& v) {
        std::string lower = v;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") return true;
        if (lower == "false" || lower == "no" || lower == "0" || lower == "off") return false;
        throw ConfigError(where + ": expected a boolean, got '" + v + "'");
    }

    static int64_t parseInt(const std::string& where, const std::string& v) {
        try {
            size_t used = 0;
            const long long n = std::stoll(v, &used);
            if (used == v.size()) return static_cast<int64_t>(n);
        } catch (const std::exception&) {
            // reported below
        }
        throw ConfigError(where + ": expected an integer, got '" + v + "'");
    }

    static double parseDouble(const std::string& where, const std::string& v) {
        try {
            size_t used = 0;
            const double d = std::stod(v, &used);
            if (used == v.size()) return d;
        } catch (const std::exception&) {
            // reported below
        }
        throw ConfigError(where + ": expected a number, got '" + v + "'");
    }

    static int64_t parsePositive(const std::string& where, const std::string& v) {
        const int64_t n = parseInt(where, v);
        if (n <= 0) throw ConfigError(where + ": must be positive, got " + v);
        return n;
    }

    static RecurrentUnit parseUnit(const std::string& where, const std::string& v) {
        if (v == "gru" || v == "GRU") return RecurrentUnit::GRU;
        if (v == "lstm" || v == "LSTM") return RecurrentUnit::LSTM;
        throw ConfigError(where + ": unknown recurrent unit '" + v + "' (expected gru or lstm)");
    }

    static std::string parsePattern(const std::string& where, const std::string& v) {
        try {
            std::regex check(v);
        } catch (const std::regex_error& e) {
            throw ConfigError(where + ": invalid pattern '" + v + "': " + e.what());
        }
        return v;
    }

    using Setter = std::function<void(const std::string& where, const std::string& value)>;

    static void applySection(const std::string& section,
                             const std::map<std::string, std::string>& entries,
                             const std::map<std::string, Setter>& setters) {
        for (const auto& [k, v] : entries) {
            const std::string where = section + "." + k;
            auto it = setters.find(k);
            if (it == setters.end()) {
                throw ConfigError("unknown configuration key: " + where);
            }
            it->second(where, v);
        }
    }

} // namespace cfg

std::string toString(RecurrentUnit unit) {
    switch (unit) {
    case RecurrentUnit::GRU:
        return "gru";
    case RecurrentUnit::LSTM:
        return "lstm";
    }
    throw std::logic_error("Unknown recurrent unit");
}

ConfigSections parseConfigSections(std::string_view text, const std::string& sourceName) {
    namespace pegtl = tao::pegtl;

    pegtl::memory_input in(text.data(), text.size(), sourceName);
    cfg::State state;
    state.source = sourceName;
    try {
        pegtl::parse< cfg::grammar, cfg::action >(in, state);
    } catch (const pegtl::parse_error& e) {
        throw ConfigError(std::string("malformed configuration: ") + e.what());
    }
    return std::move(state.sections);
}

Config Config::fromString(std::string_view text, const std::string& sourceName) {
    using namespace cfg;

    Config c;
    const ConfigSections sections = parseConfigSections(text, sourceName);

    const std::map<std::string, Setter> modelKeys = {
        {"unit", [&](const std::string& w, const std::string& v) { c.model.unit = parseUnit(w, v); }},
        {"embedding_dim", [&](const std::string& w, const std::string& v) { c.model.embeddingDim = parsePositive(w, v); }},
        {"hidden_dim", [&](const std::string& w, const std::string& v) { c.model.hiddenDim = parsePositive(w, v); }},
        {"num_layers", [&](const std::string& w, const std::string& v) { c.model.numLayers = parsePositive(w, v); }},
        {"dropout", [&](const std::string& w, const std::string& v) {
            c.model.dropout = parseDouble(w, v);
            if (c.model.dropout < 0.0 || c.model.dropout >= 1.0) {
                throw ConfigError(w + ": must lie in [0, 1), got " + v);
            }
        }},
        {"attention", [&](const std::string& w, const std::string& v) { c.model.attention = parseBool(w, v); }},
        {"max_length", [&](const std::string& w, const std::string& v) { c.model.maxLength = parsePositive(w, v); }},
    };

    const std::map<std::string, Setter> datasetKeys = {
        {"train", [&](const std::string&, const std::string& v) { c.dataset.train = v; }},
        {"test", [&](const std::string&, const std::string& v) { c.dataset.test = v; }},
        {"arith", [&](const std::string&, const std::string& v) { c.dataset.arith = v; }},
        {"offset", [&](const std::string& w, const std::string& v) { c.dataset.offset = static_cast<int>(parseInt(w, v)); }},
        {"eos_aware", [&](const std::string& w, const std::string& v) { c.dataset.eosAware = parseBool(w, v); }},
        {"delimiter", [&](const std::string& w, const std::string& v) {
            if (v.empty()) throw ConfigError(w + ": must not be empty");
            c.dataset.delimiter = v;
        }},
        {"withholding", [&](const std::string& w, const std::string& v) { c.dataset.withholding = parsePattern(w, v); }},
    };

    const std::map<std::string, Setter> trainingKeys = {
        {"lr", [&](const std::string& w, const std::string& v) { c.training.learningRate = parseDouble(w, v); }},
        {"epochs", [&](const std::string& w, const std::string& v) { c.training.epochs = static_cast<int>(parseInt(w, v)); }},
        {"batch_size", [&](const std::string& w, const std::string& v) { c.training.batchSize = static_cast<int>(parsePositive(w, v)); }},
        {"tf_ratio", [&](const std::string& w, const std::string& v) {
            c.training.tfRatio = parseDouble(w, v);
            if (c.training.tfRatio < 0.0 || c.training.tfRatio > 1.0) {
                throw ConfigError(w + ": must lie in [0, 1], got " + v);
            }
        }},
        {"seed", [&](const std::string& w, const std::string& v) { c.training.seed = static_cast<uint64_t>(parseInt(w, v)); }},
    };

    for (const auto& [section, entries] : sections) {
        if (section == "model") {
            applySection(section, entries, modelKeys);
        } else if (section == "dataset") {
            applySection(section, entries, datasetKeys);
        } else if (section == "training") {
            applySection(section, entries, trainingKeys);
        } else if (section == "tracking") {
            for (const auto& [name, pattern] : entries) {
                c.dataset.tracking[name] = parsePattern(section + "." + name, pattern);
            }
        } else if (section.empty()) {
            if (!entries.empty()) {
                throw ConfigError("key '" + entries.begin()->first + "' appears before any [section]");
            }
        } else {
            throw ConfigError("unknown configuration section: [" + section + "]");
        }
    }

    return c;
}

Config Config::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    Config c = fromString(buffer.str(), path);
    c.baseDir = std::filesystem::path(path).parent_path().string();
    return c;
}

std::string Config::resolve(const std::string& path) const {
    if (path.empty()) return path;
    const std::filesystem::path p(path);
    if (p.is_absolute() || baseDir.empty()) return path;
    return (std::filesystem::path(baseDir) / p).string();
}

} // namespace td
