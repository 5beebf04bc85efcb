/**
 * @file remote_catalog.h
 * @brief Names of the files the processing node already holds
 */

#ifndef KCENON_MEDIA_RELAY_TRANSFER_REMOTE_CATALOG_H
#define KCENON_MEDIA_RELAY_TRANSFER_REMOTE_CATALOG_H

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Remote file set, touched only on the serialized context
 */
class remote_catalog {
public:
    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return names_.count(name) != 0;
    }

    void insert(const std::string& name) { names_.insert(name); }

    void replace(const std::vector<std::string>& names) {
        names_ = std::set<std::string>(names.begin(), names.end());
    }

    void clear() { names_.clear(); }

    [[nodiscard]] auto size() const -> std::size_t { return names_.size(); }
    [[nodiscard]] auto names() const -> const std::set<std::string>& { return names_; }

private:
    std::set<std::string> names_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSFER_REMOTE_CATALOG_H
