#include "config/KeyMap.hpp"
#include <algorithm>

namespace halo::config {

KeyMap::KeyMap() {
    load_default_keybinds();
}

const std::vector<std::string>& KeyMap::actions() {
    static const std::vector<std::string> ordered = {
        "show_loading",
        "show_loading_timed",
        "show_success",
        "show_failure",
        "hide",
        "toggle_interaction",
        "quit",
    };
    return ordered;
}

void KeyMap::load_default_keybinds() {
    bindings_.clear();
    bindings_["l"] = "show_loading";
    bindings_["L"] = "show_loading_timed";
    bindings_["s"] = "show_success";
    bindings_["f"] = "show_failure";
    bindings_["h"] = "hide";
    bindings_["i"] = "toggle_interaction";
    bindings_["q"] = "quit";
}

void KeyMap::add_binding(const std::string& action, const std::string& key_sequence) {
    // One key per action: drop the previous key for this action
    for (auto it = bindings_.begin(); it != bindings_.end();) {
        if (it->second == action) {
            it = bindings_.erase(it);
        } else {
            ++it;
        }
    }
    bindings_[key_sequence] = action;
}

std::string KeyMap::lookup_action(const std::string& key_sequence) const {
    auto it = bindings_.find(key_sequence);
    if (it != bindings_.end()) {
        return it->second;
    }
    return "";
}

std::string KeyMap::key_for(const std::string& action) const {
    auto it = std::find_if(bindings_.begin(), bindings_.end(),
                           [&action](const auto& entry) { return entry.second == action; });
    return it != bindings_.end() ? it->first : "";
}

}  // namespace halo::config
