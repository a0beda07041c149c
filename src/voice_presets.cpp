//
//  voice_presets.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "voice_presets.hpp"

#include <algorithm>

namespace narrateforge {

const std::vector<VoicePreset> &voice_presets() {
    static const std::vector<VoicePreset> kPresets = {
        {"Professional Female Narrator",
         "A female speaker with a warm, calm, and clear voice, delivering the narration in "
         "a standard American English accent. Her tone is engaging and pleasant, suitable "
         "for long listening sessions.",
         "female_professional", "40s", "American"},
        {"Authoritative Male (Morgan Freeman-style)",
         "A deep, resonant male voice in his 60s with a commanding yet warm presence. He "
         "speaks with a refined American accent, delivering each word with gravitas and "
         "authority, perfect for dramatic narration and non-fiction.",
         "male_professional", "60s", "American"},
        {"Young Adult Female (Energetic)",
         "A bright, energetic female voice in her early 20s with excellent articulation. "
         "Her delivery is expressive and dynamic, with a contemporary American accent "
         "that's perfect for young adult fiction and romance novels.",
         "female_young", "20s", "American"},
        {"Distinguished British Male",
         "A mature male speaker with a distinguished Received Pronunciation British "
         "accent. His voice is cultured and articulate, ideal for classical literature, "
         "historical fiction, and mystery novels.",
         "male_professional", "50s", "British"},
        {"Soothing Female (Bedtime Stories)",
         "A gentle, soothing female voice with a soft, melodic quality. She speaks slowly "
         "and calmly with a warm American accent, creating a peaceful atmosphere perfect "
         "for bedtime stories and relaxation content.",
         "female_soothing", "30s", "American"},
        {"Conversational Male (Podcast-style)",
         "A casual, friendly male voice in his 30s with a natural conversational tone. His "
         "American accent is neutral and approachable, making him ideal for non-fiction, "
         "memoirs, and contemporary fiction.",
         "male_casual", "30s", "American"},
        {"Elegant Female (Literary Fiction)",
         "A refined female voice with impeccable diction and a sophisticated American "
         "accent. She delivers prose with artistic sensibility and emotional depth, "
         "perfect for literary fiction and poetry.",
         "female_professional", "40s", "American"},
        {"Dramatic Male (Fantasy/Sci-Fi)",
         "A powerful, expressive male voice capable of rich dramatic range. His deep "
         "timbre and theatrical delivery bring epic fantasy and science fiction narratives "
         "to life with intensity and passion.",
         "male_dramatic", "40s", "American"},
        {"Cheerful Female (Children's Books)",
         "An upbeat, animated female voice that's warm and inviting. She brings characters "
         "to life with playful energy and clear enunciation, perfect for children's "
         "literature and middle-grade fiction.",
         "female_young", "30s", "American"},
        {"Wise Elder Male",
         "A seasoned male voice in his 70s with a gentle, grandfatherly quality. His "
         "speech is measured and thoughtful with subtle warmth, ideal for philosophical "
         "works, memoirs, and inspirational content.",
         "male_mature", "70s", "American"},
        {"Southern Female (Regional Charm)",
         "A warm female voice with a gentle Southern American accent. Her drawl is "
         "authentic yet easy to understand, adding regional flavor perfect for Southern "
         "fiction and historical narratives.",
         "female_regional", "40s", "Southern US"},
        {"Academic Male (Non-Fiction)",
         "A clear, articulate male voice with an educated mid-Atlantic accent. His "
         "delivery is precise and authoritative without being dry, excellent for academic "
         "texts, biographies, and historical non-fiction.",
         "male_professional", "50s", "Mid-Atlantic"},
        {"Intimate Female (Romance)",
         "A sultry, expressive female voice with emotional depth and range. She delivers "
         "romantic passages with genuine warmth and sensuality, perfect for romance novels "
         "and intimate character-driven stories.",
         "female_expressive", "30s", "American"},
        {"Youthful Male (Adventure)",
         "An energetic male voice in his 20s with an adventurous spirit. His delivery is "
         "quick-paced and enthusiastic with clear American pronunciation, ideal for "
         "action-adventure and thriller genres.",
         "male_young", "20s", "American"},
        {"Neutral Narrator (Versatile)",
         "A balanced, versatile voice with neutral American pronunciation and moderate "
         "pacing. This narrator adapts well to any genre with professional clarity and "
         "consistent quality throughout long narrations.",
         "neutral_professional", "35-45", "American"},
    };
    return kPresets;
}

const VoicePreset *find_voice_preset(std::string_view name) {
    for (const auto &preset : voice_presets()) {
        if (preset.name == name) {
            return &preset;
        }
    }
    return nullptr;
}

std::vector<std::string> voice_preset_names() {
    std::vector<std::string> names;
    for (const auto &preset : voice_presets()) {
        names.push_back(preset.name);
    }
    return names;
}

std::vector<const VoicePreset *> voice_presets_in_category(std::string_view category) {
    std::vector<const VoicePreset *> out;
    for (const auto &preset : voice_presets()) {
        if (preset.category == category) {
            out.push_back(&preset);
        }
    }
    return out;
}

std::vector<std::string> voice_preset_categories() {
    std::vector<std::string> out;
    for (const auto &preset : voice_presets()) {
        out.push_back(preset.category);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

}  // namespace narrateforge
