//
//  voice_presets.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace narrateforge {

/// Named narrator voice; `description` is the text handed to the engine as VoiceParams.
struct VoicePreset {
    std::string name;
    std::string description;
    std::string category;
    std::string age;
    std::string accent;
};

// Built-in catalog in display order.
const std::vector<VoicePreset> &voice_presets();

// Exact name lookup; nullptr when unknown.
const VoicePreset *find_voice_preset(std::string_view name);

std::vector<std::string> voice_preset_names();
std::vector<const VoicePreset *> voice_presets_in_category(std::string_view category);

// Sorted, without duplicates.
std::vector<std::string> voice_preset_categories();

}  // namespace narrateforge
