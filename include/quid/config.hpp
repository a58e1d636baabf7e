#pragma once

#include <quid/log.hpp>
#include <quid/node.hpp>
#include <quid/result.hpp>
#include <quid/tags.hpp>
#include <quid/uuid.hpp>
#include <memory>
#include <optional>
#include <string>

namespace quid {

enum class NodeSource {
    Interface,
    Fixed,
    Random
};

struct NodeConfig {
    NodeSource source = NodeSource::Interface;
    std::optional<Node> address;              // required when source == Fixed
    NodeFallback fallback = NodeFallback::Random;
};

struct FormatConfig {
    Case letter_case = Case::Lower;
    bool urn = false;
};

// Generator settings read from TOML:
//
//   [node]   source = "interface" | "fixed" | "random"
//            address = "aa:bb:cc:dd:ee:ff"
//            fallback = "random" | "none"
//   [format] case = "lower" | "upper"
//            urn = true | false
//   [log]    level = "trace" .. "error"
struct Config {
    NodeConfig node;
    FormatConfig format;
    log::Level log_level = log::Info;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    std::shared_ptr<const NodeProvider> make_node_provider() const;

    // Render according to [format].
    std::string render(const Uuid& u) const;
};

} // namespace quid
