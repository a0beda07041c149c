// Sample-level helpers: RMS, warm-up trim, fades, silence trimming and peak normalization.
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "audio_utils.hpp"

using namespace narrateforge;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[audio_utils_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

// `lead` zeros, `body` samples at `level`, `tail` zeros.
std::vector<float> padded(size_t lead, size_t body, size_t tail, float level = 0.5f) {
    std::vector<float> out(lead, 0.0f);
    out.insert(out.end(), body, level);
    out.insert(out.end(), tail, 0.0f);
    return out;
}

bool test_levels() {
    bool ok = check(compute_rms({}) == 0.0, "empty rms");
    ok &= check(std::fabs(compute_rms({0.5f, -0.5f}) - 0.5) < 1e-9, "constant magnitude rms");
    ok &= check(peak_level({0.1f, -0.8f, 0.3f}) == 0.8f, "peak uses magnitude");
    ok &= check(samples_for_seconds(0.25, 22050) == 5512, "seconds truncate to samples");
    ok &= check(samples_for_seconds(-1.0, 48000) == 0 && samples_for_seconds(1.0, 0) == 0,
                "negative or rateless durations are empty");
    return ok;
}

bool test_warmup_and_fades() {
    std::vector<float> s(1000, 1.0f);
    drop_warmup(s, 200);
    bool ok = check(s.size() == 800, "warm-up dropped");
    std::vector<float> tiny(100, 1.0f);
    drop_warmup(tiny, 100);
    ok &= check(tiny.size() == 100, "buffer not longer than the warm-up is kept");

    apply_edge_fades(s, 101);
    ok &= check(s.front() == 0.0f && s.back() == 0.0f, "edges start and end at zero");
    ok &= check(s[100] == 1.0f && s[699] == 1.0f, "fade ends at full gain");
    ok &= check(std::fabs(s[50] - 0.5f) < 1e-6f, "linear ramp");

    std::vector<float> short_buf(8, 1.0f);
    apply_edge_fades(short_buf, 320);
    ok &= check(short_buf.front() == 0.0f && short_buf[2] == 1.0f,
                "fade limited to a quarter of the buffer");
    return ok;
}

bool test_trim_silence() {
    // 1 kHz rate: 200 ms of silence around 100 ms of sound.
    auto s = padded(200, 100, 200);
    const size_t removed = trim_silence(s, 1000, -40.0, 0.05, 0.05);
    bool ok = check(removed == 300 && s.size() == 200, "edges trimmed down to the pad");
    ok &= check(s[49] == 0.0f && s[50] == 0.5f && s[149] == 0.5f && s[150] == 0.0f,
                "pad kept on both sides");

    auto short_lead = padded(30, 100, 200);
    trim_silence(short_lead, 1000, -40.0, 0.05, 0.01);
    ok &= check(short_lead.size() == 30 + 100 + 10, "run shorter than the minimum is kept");

    auto quiet = padded(100, 50, 100, 0.005f);
    ok &= check(trim_silence(quiet, 1000, -40.0, 0.05, 0.0) == 0 && quiet.size() == 250,
                "audio below the threshold throughout is left alone");

    auto loud = padded(0, 50, 0);
    ok &= check(trim_silence(loud, 1000, -40.0, 0.0, 0.1) == 0 && loud.size() == 50,
                "no silence to trim");

    auto hot = padded(100, 50, 100, 0.005f);
    ok &= check(trim_silence(hot, 1000, -60.0, 0.05, 0.0) == 200 && hot.size() == 50,
                "lower threshold treats quiet audio as sound");
    return ok;
}

bool test_normalize_peak() {
    std::vector<float> s{0.25f, -0.125f, 0.0f};
    const double gain = normalize_peak(s, -3.0);
    const float target = static_cast<float>(std::pow(10.0, -3.0 / 20.0));
    bool ok = check(std::fabs(s[0] - target) < 1e-6f, "peak moved to the target level");
    ok &= check(std::fabs(s[1] + target / 2.0f) < 1e-6f, "relative levels preserved");
    ok &= check(std::fabs(gain - target / 0.25) < 1e-6, "gain reported");

    std::vector<float> silent(16, 0.0f);
    ok &= check(normalize_peak(silent, -3.0) == 1.0 && peak_level(silent) == 0.0f,
                "silence left unchanged");

    std::vector<float> full{1.0f, -0.5f};
    normalize_peak(full, 0.0);
    ok &= check(full[0] == 1.0f && full[1] == -0.5f, "0 dBFS target keeps a full-scale buffer");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_levels();
    ok &= test_warmup_and_fades();
    ok &= test_trim_silence();
    ok &= test_normalize_peak();
    if (ok) {
        std::cout << "audio_utils_unit OK\n";
    }
    return ok ? 0 : 1;
}
