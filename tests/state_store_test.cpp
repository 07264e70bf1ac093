#undef NDEBUG
#include "core/clock.hpp"
#include "core/state_store.hpp"

#include "test_support.hpp"

#include <glibmm/fileutils.h>

#include <cassert>

namespace {
PrivacyState enabled(const std::string& name, TimePoint at) {
    PrivacyState state;
    state.camera_name = name;
    state.privacy_enabled = true;
    state.enabled_at = at;
    return state;
}

void write_file(const std::string& path, const std::string& text) {
    Glib::file_set_contents(path, text);
}
}

int main() {
    TempDir dir;
    const TimePoint t0 = ManualClock().now() + std::chrono::microseconds(123456);

    {
        StateStore store(dir.file("state_{camera}.json"));
        assert(store.per_camera_files());
        assert(store.path_for("Bedroom") == dir.file("state_Bedroom.json"));
        assert(store.path_for("Front/Door") == dir.file("state_Front_Door.json"));
        assert(store.load({"Bedroom", "Kitchen"}, t0).empty());
    }

    {
        // Enabled records round-trip exactly, down to the microsecond.
        StateStore store(dir.file("nested/dir/state_{camera}.json"));
        PrivacyState bedroom = enabled("Bedroom", t0);
        assert(store.save(bedroom));

        PrivacyState kitchen;
        kitchen.camera_name = "Kitchen";
        assert(store.save(kitchen));

        auto loaded = store.load({"Bedroom", "Kitchen", "Garage"}, t0 + std::chrono::hours(1));
        assert(loaded.size() == 2);
        assert(loaded.at("Bedroom") == bedroom);
        assert(loaded.at("Kitchen") == kitchen);
        assert(!loaded.at("Kitchen").enabled_at);

        std::string text = Glib::file_get_contents(store.path_for("Kitchen"));
        assert(text.find("\"privacy_start_time\" : null") != std::string::npos);
    }

    {
        // The timestamp stays the original one no matter how often the state is reloaded.
        StateStore store(dir.file("stable_{camera}.json"));
        assert(store.save(enabled("Bedroom", t0)));
        for (int i = 1; i <= 3; ++i) {
            auto loaded = store.load({"Bedroom"}, t0 + std::chrono::minutes(i));
            assert(loaded.at("Bedroom").enabled_at == t0);
            assert(store.save(loaded.at("Bedroom")));
        }
    }

    {
        // Unknown members are ignored; malformed files are skipped.
        StateStore store(dir.file("extra_{camera}.json"));
        write_file(store.path_for("Bedroom"),
                   "{\"camera_name\": \"Bedroom\", \"privacy_enabled\": false, "
                   "\"privacy_start_time\": null, \"firmware\": \"4.1\", \"extra\": [1, 2]}");
        write_file(store.path_for("Kitchen"), "{ not json");
        auto loaded = store.load({"Bedroom", "Kitchen"}, t0);
        assert(loaded.size() == 1);
        assert(!loaded.at("Bedroom").privacy_enabled);
    }

    {
        // Invariant violations are repaired on load.
        StateStore store(dir.file("repair_{camera}.json"));
        write_file(store.path_for("Bedroom"), "{\"privacy_enabled\": true, \"privacy_start_time\": null}");
        write_file(store.path_for("Kitchen"),
                   "{\"privacy_enabled\": false, \"privacy_start_time\": \"2025-10-09T08:00:00+00:00\"}");
        auto loaded = store.load({"Bedroom", "Kitchen"}, t0);
        assert(loaded.at("Bedroom").privacy_enabled);
        assert(loaded.at("Bedroom").enabled_at == t0);
        assert(!loaded.at("Kitchen").privacy_enabled);
        assert(!loaded.at("Kitchen").enabled_at);
        assert(privacy_state_consistent(loaded.at("Bedroom")));
        assert(privacy_state_consistent(loaded.at("Kitchen")));
    }

    {
        // Offsets in stored timestamps are honoured.
        StateStore store(dir.file("offset_{camera}.json"));
        write_file(store.path_for("Bedroom"),
                   "{\"privacy_enabled\": true, \"privacy_start_time\": \"2025-10-09T10:00:00+02:00\"}");
        auto loaded = store.load({"Bedroom"}, t0);
        TimePoint expected = TimePoint(std::chrono::seconds(1759996800));
        assert(loaded.at("Bedroom").enabled_at == expected);
    }

    {
        // Shared document keeps every camera and foreign members.
        const std::string path = dir.file("shared.json");
        write_file(path, "{\"version\": 2, \"cameras\": {\"Garage\": {\"privacy_enabled\": false}}}");
        StateStore store(path);
        assert(!store.per_camera_files());
        assert(store.path_for("Bedroom") == path);

        assert(store.save(enabled("Bedroom", t0)));
        PrivacyState kitchen;
        kitchen.camera_name = "Kitchen";
        assert(store.save(kitchen));

        auto loaded = store.load({"Bedroom", "Kitchen", "Garage"}, t0);
        assert(loaded.size() == 3);
        assert(loaded.at("Bedroom") == enabled("Bedroom", t0));
        assert(!loaded.at("Kitchen").privacy_enabled);

        std::string text = Glib::file_get_contents(path);
        assert(text.find("\"version\" : 2") != std::string::npos);
    }

    {
        // A record written under another camera's name is not adopted.
        StateStore store(dir.file("owner_{camera}.json"));
        assert(store.path_for("Front/Door") == store.path_for("Front_Door"));
        assert(store.save(enabled("Front_Door", t0)));
        auto loaded = store.load({"Front/Door", "Front_Door"}, t0);
        assert(loaded.size() == 1);
        assert(loaded.count("Front/Door") == 0);
        assert(loaded.at("Front_Door").privacy_enabled);
    }

    {
        assert(StateStore(dir.file("s_{camera}.json")).describe().find("one file per camera") == 0);
        std::string shared = StateStore(dir.file("privacy_state.json")).describe();
        assert(shared.find("shared file") == 0);
        assert(shared.find("{camera}") != std::string::npos);
    }

    {
        // A write that cannot land reports failure and leaves nothing behind.
        write_file(dir.file("blocker"), "not a directory");
        StateStore store(dir.file("blocker/state_{camera}.json"));
        assert(!store.save(enabled("Bedroom", t0)));
        assert(store.load({"Bedroom"}, t0).empty());
    }

    return 0;
}
