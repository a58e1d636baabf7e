// quid_gen.cpp
//
// Command-line front end for the generator. Run it with:
//
//     ./quid_gen v1                          # time-based
//     ./quid_gen v2 person|group|org         # DCE security
//     ./quid_gen v3 dns|url|oid|x500 <name>  # MD5 name-based
//     ./quid_gen v4                          # random
//     ./quid_gen v5 dns|url|oid|x500 <name>  # SHA-1 name-based
//     ./quid_gen check <text>                # exit 0 if the text is valid
//
// Options (before the command):
//
//     -c <config.toml>   node source, output case and urn prefix, log level
//     -n <count>         how many identifiers to print (v1, v2, v4)

#include <quid/config.hpp>
#include <quid/generator.hpp>
#include <quid/log.hpp>
#include <quid/uuid.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace quid;

struct Args {
    std::string config_path;
    int count = 1;
    std::vector<std::string> positional;
};

static Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "-c" || a == "-n") && i + 1 >= argc) {
            return QuidError{QuidError::InvalidArg,
                "option " + a + " needs a value"};
        }
        if (a == "-c") {
            args.config_path = argv[++i];
        } else if (a == "-n") {
            args.count = std::atoi(argv[++i]);
            if (args.count <= 0) {
                return QuidError{QuidError::InvalidArg,
                    "count must be a positive integer"};
            }
        } else {
            args.positional.push_back(a);
        }
    }
    if (args.positional.empty()) {
        return QuidError{QuidError::InvalidArg,
            "no command specified",
            "usage: quid_gen [-c config.toml] [-n count] <v1|v2|v3|v4|v5|check> [args]"};
    }
    return Result<Args>::ok(args);
}

static Result<Uuid> namespace_by_name(const std::string& name) {
    if (name == "dns")  return Result<Uuid>::ok(ns::DNS);
    if (name == "url")  return Result<Uuid>::ok(ns::URL);
    if (name == "oid")  return Result<Uuid>::ok(ns::OID);
    if (name == "x500") return Result<Uuid>::ok(ns::X500);
    return QuidError{QuidError::InvalidArg,
        "unknown namespace '" + name + "'",
        "expected one of: dns, url, oid, x500"};
}

static Result<Domain> domain_by_name(const std::string& name) {
    if (name == "person") return Result<Domain>::ok(Domain::Person);
    if (name == "group")  return Result<Domain>::ok(Domain::Group);
    if (name == "org")    return Result<Domain>::ok(Domain::Org);
    return QuidError{QuidError::InvalidArg,
        "unknown domain '" + name + "'",
        "expected one of: person, group, org"};
}

static Result<std::vector<Uuid>> generate(const Args& args, const Generator& gen) {
    const auto& cmd = args.positional[0];
    std::vector<Uuid> out;

    if (cmd == "v3" || cmd == "v5") {
        if (args.positional.size() != 3) {
            return QuidError{QuidError::InvalidArg,
                cmd + " takes a namespace and a name"};
        }
        auto nspace = namespace_by_name(args.positional[1]);
        QUID_TRY(nspace);
        const auto& name = args.positional[2];
        out.push_back(cmd == "v3" ? Uuid::v3(name, nspace.value())
                                  : Uuid::v5(name, nspace.value()));
        return Result<std::vector<Uuid>>::ok(out);
    }

    for (int i = 0; i < args.count; ++i) {
        if (cmd == "v1") {
            auto u = gen.v1();
            QUID_TRY(u);
            out.push_back(u.value());
        } else if (cmd == "v2") {
            if (args.positional.size() != 2) {
                return QuidError{QuidError::InvalidArg, "v2 takes a domain"};
            }
            auto domain = domain_by_name(args.positional[1]);
            QUID_TRY(domain);
            auto u = gen.v2(domain.value());
            QUID_TRY(u);
            out.push_back(u.value());
        } else if (cmd == "v4") {
            out.push_back(Uuid::v4());
        } else {
            return QuidError{QuidError::InvalidArg,
                "unknown command '" + cmd + "'",
                "expected one of: v1, v2, v3, v4, v5, check"};
        }
    }
    return Result<std::vector<Uuid>>::ok(out);
}

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return 2;
    }

    Config cfg;
    if (!args.value().config_path.empty()) {
        auto loaded = Config::load(args.value().config_path);
        if (loaded.is_err()) {
            std::cerr << loaded.error().format() << "\n";
            return 1;
        }
        cfg = loaded.value();
    }
    log::set_level(cfg.log_level);

    const auto& pos = args.value().positional;
    if (pos[0] == "check") {
        if (pos.size() != 2) {
            std::cerr << QuidError(QuidError::InvalidArg, "check takes one argument").format() << "\n";
            return 2;
        }
        bool ok = Uuid::is_valid(pos[1]);
        std::cout << (ok ? "valid" : "invalid") << "\n";
        return ok ? 0 : 1;
    }

    auto provider = cfg.make_node_provider();
    log::debug("node source: %s", provider->name());
    Generator gen(provider);

    auto result = generate(args.value(), gen);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    for (const auto& u : result.value()) {
        std::cout << cfg.render(u) << "\n";
    }
    return 0;
}
