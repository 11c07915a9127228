#pragma once
#include "upbus/app/Config.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace upbus { namespace example {
/**
 * @brief turn every entry of a JSON config with "__name" doc entries into a
 * command line option
 * @return the resulting flat config, nothing when --help was asked for
 */
inline
std::optional<app::Config>
parseCmdLine(int argc, char** argv, char const* helpStr, char const* cfgString) {
    namespace po = boost::program_options;
    po::options_description desc("Allowed cmd options");
    desc.add_options()
    ("help,h", helpStr)
    ;

    app::Config config(cfgString);
    auto params = config.content();
    for (auto it = params.begin(); it != params.end();) {
        std::string& name = it->first;
        std::string& val = it->second;
        it++;
        std::string& comment = it->second;
        it++;
        desc.add_options()
            (name.c_str(), po::value<std::string>(&val)->default_value(val), comment.c_str());
    }

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
    po::notify(vm);
    if (vm.count("help")) {
        std::cout << desc << "\n";
        return std::nullopt;
    }

    app::Config res;
    for (auto it = params.begin(); it != params.end(); ++it) {
        res.put(it->first, it->second);
    }
    return res;
}

/**
 * @brief the NetworkTransport settings an example exposes on its command line
 */
inline
app::Config
netConfig(app::Config const& cmdLine) {
    app::Config res;
    res.put("ifaceAddr", cmdLine.getExt<std::string>("ifaceAddr"))
        .put("tx.udpcastDests", cmdLine.getExt<std::string>("udpcastDests"))
        .put("rx.udpcastListenAddr", cmdLine.getExt<std::string>("udpcastListenAddr"))
        .put("rx.udpcastListenPort", cmdLine.getExt<std::string>("udpcastListenPort"));
    return res;
}
}}
