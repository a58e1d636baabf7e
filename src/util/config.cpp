#include <quid/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>

namespace quid {

static QuidError bad_value(const std::string& key, const std::string& got,
                           const std::string& expected) {
    return QuidError{QuidError::Config,
        "invalid value '" + got + "' for " + key,
        "expected one of: " + expected};
}

static Result<NodeConfig> parse_node(const toml::table& tbl) {
    NodeConfig nc;

    if (auto v = tbl["source"].value<std::string>()) {
        if (*v == "interface")   nc.source = NodeSource::Interface;
        else if (*v == "fixed")  nc.source = NodeSource::Fixed;
        else if (*v == "random") nc.source = NodeSource::Random;
        else return bad_value("node.source", *v, "interface, fixed, random");
    }

    if (auto v = tbl["address"].value<std::string>()) {
        auto parsed = Node::parse(*v);
        if (parsed.is_err()) {
            return QuidError{QuidError::Config,
                "node.address: " + parsed.error().message, parsed.error().hint};
        }
        nc.address = parsed.value();
    }

    if (auto v = tbl["fallback"].value<std::string>()) {
        if (*v == "random")    nc.fallback = NodeFallback::Random;
        else if (*v == "none") nc.fallback = NodeFallback::None;
        else return bad_value("node.fallback", *v, "random, none");
    }

    if (nc.source == NodeSource::Fixed && !nc.address.has_value()) {
        return QuidError{QuidError::Config,
            "node.source = \"fixed\" requires node.address",
            "add address = \"aa:bb:cc:dd:ee:ff\" to the [node] table"};
    }
    return Result<NodeConfig>::ok(nc);
}

static Result<FormatConfig> parse_format(const toml::table& tbl) {
    FormatConfig fc;

    if (auto v = tbl["case"].value<std::string>()) {
        if (*v == "lower")      fc.letter_case = Case::Lower;
        else if (*v == "upper") fc.letter_case = Case::Upper;
        else return bad_value("format.case", *v, "lower, upper");
    }
    if (auto v = tbl["urn"].value<bool>()) {
        fc.urn = *v;
    }
    return Result<FormatConfig>::ok(fc);
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return QuidError{QuidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    if (auto node_tbl = doc["node"].as_table()) {
        auto nc = parse_node(*node_tbl);
        QUID_TRY(nc);
        cfg.node = nc.value();
    }

    if (auto format_tbl = doc["format"].as_table()) {
        auto fc = parse_format(*format_tbl);
        QUID_TRY(fc);
        cfg.format = fc.value();
    }

    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            QUID_TRY(lvl);
            cfg.log_level = lvl.value();
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return QuidError{QuidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

std::shared_ptr<const NodeProvider> Config::make_node_provider() const {
    switch (node.source) {
    case NodeSource::Fixed:
        if (node.address.has_value()) {
            return std::make_shared<FixedNodeProvider>(*node.address);
        }
        break;
    case NodeSource::Random:
        return std::make_shared<RandomNodeProvider>();
    case NodeSource::Interface:
        break;
    }
    return std::make_shared<InterfaceNodeProvider>(node.fallback);
}

std::string Config::render(const Uuid& u) const {
    return format.urn ? u.to_urn(format.letter_case) : u.to_string(format.letter_case);
}

} // namespace quid
