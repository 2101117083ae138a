#ifndef HACKLOG_SELECTOR_HPP
#define HACKLOG_SELECTOR_HPP

#include "../core/log_common.hpp"
#include <string>
#include <vector>

namespace hacklog {
namespace detail {

    inline std::string quoteLogql(const std::string &value) {
        std::string out;
        out.reserve(value.size() + 2);
        out += '"';
        for (char c : value) {
            if (c == '\\' || c == '"') out += '\\';
            out += c;
        }
        out += '"';
        return out;
    }

    inline std::string escapeRegex(const std::string &value) {
        static const std::string meta = ".*+?^${}()|[]\\";
        std::string out;
        out.reserve(value.size());
        for (char c : value) {
            if (meta.find(c) != std::string::npos) out += '\\';
            out += c;
        }
        return out;
    }

} // namespace detail

    /// Build a LogQL stream selector scoping a query to a project and an
    /// optional set of services.
    ///
    /// @code
    ///   buildLogSelector("shop", {})             // {project="shop"}
    ///   buildLogSelector("shop", {"api"})        // {project="shop",service="api"}
    ///   buildLogSelector("shop", {"api", "web"}) // {project="shop",service=~"^(api|web)$"}
    /// @endcode
    inline std::string buildLogSelector(const std::string &project,
                                        const std::vector<std::string> &services) {
        std::vector<std::string> parts;
        if (!project.empty()) {
            parts.push_back("project=" + detail::quoteLogql(project));
        }
        if (services.size() == 1) {
            parts.push_back("service=" + detail::quoteLogql(services[0]));
        } else if (services.size() > 1) {
            std::vector<std::string> escaped;
            escaped.reserve(services.size());
            for (const auto &s : services) escaped.push_back(detail::escapeRegex(s));
            std::string pattern = "^(" + detail::join(escaped, "|") + ")$";
            parts.push_back("service=~" + detail::quoteLogql(pattern));
        }
        return "{" + detail::join(parts, ",") + "}";
    }

} // namespace hacklog

#endif // HACKLOG_SELECTOR_HPP
