#ifndef CORE_STATE_STORE_HPP
#define CORE_STATE_STORE_HPP

#include "core/models.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

// Durable PrivacyState records. A template containing "{camera}" keeps one JSON
// file per camera; any other template names a single shared document of the form
// {"cameras": {"<name>": record}}. Every write replaces the target file atomically
// (temporary file, fsync, rename), so a crash leaves the previous version intact.
class StateStore {
public:
    static constexpr const char* kCameraPlaceholder = "{camera}";

    explicit StateStore(std::string path_template);

    // Missing files yield no entry. Unreadable or malformed records are logged and
    // skipped. Records breaking the enabled/enabled_at invariant are repaired,
    // using loaded_at for an enabled record without a start time.
    std::map<std::string, PrivacyState> load(const std::vector<std::string>& camera_names,
                                             TimePoint loaded_at) const;

    bool save(const PrivacyState& state);

    std::string path_for(const std::string& camera_name) const;
    bool per_camera_files() const;

    // One-line summary of the storage layout for startup output.
    std::string describe() const;

private:
    std::string m_template;
    std::mutex m_shared_document_mutex;
};

#endif
