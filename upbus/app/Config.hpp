#pragma once

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <string>
#include <memory>
#include <list>
#include <unordered_set>
#include <sstream>
#include <cstdint>


/**
 * @namespace upbus::app
 * upbus's application layer helpers: configuration and logging
 */
namespace upbus { namespace app {

namespace config_detail {

/**
 * @brief class to hold an upbus configuration
 * @details it is based on a two level (fallback and section) json.
 * top level for the fallback values and lower level for the section specific values.
 * a Config instance is always constructed to be associated to 0 or 1 specific section.
 * shown below:
 *
 *      {
 *          "ifaceAddr": "top level, value used as a fallback",
 *          "mtu": "fallback is used when not configured in a section",
 *          "tx": {
 *               "mtu": "lower level, a specific value effective in tx",
 *          },
 *          "rx": {
 *               "ifaceAddr": "a specific value effective in rx"
 *          }
 *      }
 *  json array is not supported
 */
struct Config
: boost::property_tree::ptree {
    using Base = boost::property_tree::ptree;

    /**
     * @brief empty config
     */
    Config(){}

    Config(Config const& other)
    : Base(other)
    , section_(other.section_)
    , fallbackConfig_(other.fallbackConfig_
        ?new Config(*other.fallbackConfig_)
        :nullptr)
    {}

    Config& operator = (Config const& other) {
        (Base&)*this = other;
        section_ = other.section_;
        fallbackConfig_.reset(other.fallbackConfig_
            ?new Config(*other.fallbackConfig_)
            :nullptr);
        return *this;
    }

    /**
     * @brief construct using stream, optionally specifying the section name
     * @details if the section is nullptr, just use the fallback values. if
     * the section name cannot be found, throw an exception
     *
     * @param is stream as input providing a json stream
     * @param section pointing to the effective section in the json above
     */
    explicit
    Config(std::istream&& is, char const* section = nullptr)
    : section_(section?section:"") {
        read_json(is, (Base&)*this);
        get_child(section_);
    }

    /**
     * @brief construct using a json string, optionally specifying the section name
     */
    explicit
    Config(char const* json, char const* section = nullptr)
    : Config(std::istringstream(json), section)
    {}

    /**
     * @brief set additional defaults
     * @details previously set defaults take precedence
     *
     * @param c a config holding configuration values
     * @return *this
     */
    Config& setAdditionalFallbackConfig(Config const& c) {
        if (!fallbackConfig_) {
            fallbackConfig_.reset(new Config(c));
        } else {
            fallbackConfig_->setAdditionalFallbackConfig(c);
        }
        return *this;
    }

    /**
     * @brief change section name
     * @details the fallbacks also changes accordingly if possible
     *
     * @param section new section name
     * @param sectionExists check if the section exist in current config
     * - exlcuding fallbacks if set to true
     * @return object itself
     */
    Config& resetSection(char const* section, bool sectionExists = true) {
        if (sectionExists) get_child(section);
        auto sec = section?section:"";
        if (get_child_optional(sec)) section_ = sec; //else no change
        if (fallbackConfig_) {
            fallbackConfig_->resetSection(section, false);
        }
        return *this;
    }

    /**
     * @brief forward the call to ptree's put but return Config
     */
    template <typename ...Args>
    Config& put(Args&&... args) {
        Base::put(std::forward<Args>(args)...);
        return *this;
    }

    /**
     * @brief get a value from the config
     * @details check the section for it, if not found, try the top level,
     * then the fallbacks. If throwIfMissing, throw exception ptree_bad_path if all fail
     *
     * @param param config parameter name
     * @param throwIfMissing - true if no config found, throw an exception; otherwise return empty
     * @tparam T type of the value
     * @return result
     */
    template <typename T>
    T getExt(const path_type& param, bool throwIfMissing = true) const {
        auto sec = section_;
        auto res = get_optional<T>(sec/=param);
        if (!res) {
            res = get_optional<T>(param);
            if (!res) {
                if (get_child_optional(param)) {
                    throw boost::property_tree::ptree_bad_data(
                        section_.dump() + ":invalid data", param);
                }
                if (fallbackConfig_) {
                    return fallbackConfig_->getExt<T>(param, throwIfMissing);
                } else if (throwIfMissing) {
                    throw boost::property_tree::ptree_bad_path(
                        section_.dump() + ":invalid param and no fallback Config set", param);
                } else {
                    return T{};
                }
            }
        }
        return *res;
    }

    /**
     * @brief get a number value in hex format, like "a34b"
     */
    template <typename T>
    T getHex(boost::property_tree::ptree::path_type const& param
        , bool throwIfMissing = true) const {
        std::istringstream iss(getExt<std::string>(param, throwIfMissing));
        uint64_t res = 0;
        iss >> std::hex >> res;
        if (!iss) {
            throw boost::property_tree::ptree_bad_data(
                section_.dump() + ":not a hex number", param);
        }
        return static_cast<T>(res);
    }

    /**
     * @brief fill in a variable with a configured value retrieved using getExt
     * @details example cfg(abc, "abc")(def, "def");
     *
     * @param to destination
     * @param param config parameter
     * @param throwIfMissing - true if no config found, throw an exception
     *
     * @return the Config object itself
     */
    template <typename T>
    Config const& operator()(T& to, const boost::property_tree::ptree::path_type& param
        , bool throwIfMissing = true) const {
        to = getExt<T>(param, throwIfMissing);
        return *this;
    }

    /**
     * @brief get contents of all the effective configure in the form of list of string pairs
     * @details only effective ones are shown
     *
     * @param skipThese skip those config params
     * @return list of string pairs in the original order of ptree nodes
     */
    std::list<std::pair<std::string, std::string>> content(
        std::unordered_set<std::string> const& skipThese = std::unordered_set<std::string>()) const {
        std::list<std::pair<std::string, std::string>> res;
        std::unordered_set<std::string> history(skipThese);
        auto secTree = get_child_optional(section_);
        if (secTree) {
            for (auto& p : *secTree) {
                if (history.find(p.first) == history.end()) {
                    history.insert(p.first);
                    if (p.second.empty()) { //leaf
                        res.push_back(make_pair(p.first, p.second.get_value<std::string>()));
                    }
                }
            }
        }
        for (auto& p : *this) {
            if (history.find(p.first) == history.end()) {
                history.insert(p.first);
                if (p.second.empty()) { //leaf
                    res.push_back(make_pair(p.first, p.second.get_value<std::string>()));
                }
            }
        }
        if (fallbackConfig_) {
            auto more = fallbackConfig_->content(history);
            res.insert(res.end(), more.begin(), more.end());
        }
        return res;
    }

    /**
     * @brief stream out the effective settings
     */
    friend std::ostream& operator << (std::ostream& os, Config const& cfg) {
        for (auto& r : cfg.content()) {
            os << r.first << '=' << r.second << std::endl;
        }
        return os;
    }

private:
    boost::property_tree::ptree::path_type section_;
    std::unique_ptr<Config> fallbackConfig_;
};
} //config_detail

using Config = config_detail::Config;
}}
