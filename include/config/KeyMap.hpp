#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace halo::config {

/**
 * Maps single key names (as produced by Terminal::read_input) to demo
 * actions.
 */
class KeyMap {
public:
    KeyMap();

    void load_default_keybinds();
    void add_binding(const std::string& action, const std::string& key_sequence);
    std::string lookup_action(const std::string& key_sequence) const;

    // First key bound to `action`, empty if unbound
    std::string key_for(const std::string& action) const;

    // Actions in display order
    static const std::vector<std::string>& actions();

private:
    std::unordered_map<std::string, std::string> bindings_;
};

}  // namespace halo::config
