// Tests for WAV reading, writing and conversion to Whisper input

#include "wav_file.hpp"
#include "test_fakes.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>

using namespace voxchord;
using namespace voxchord::testing;

namespace fs = std::filesystem;

void append_u16(std::vector<unsigned char>& out, uint16_t v) {
    out.push_back(v & 0xFF);
    out.push_back((v >> 8) & 0xFF);
}

void append_u32(std::vector<unsigned char>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back((v >> (8 * i)) & 0xFF);
}

void append_tag(std::vector<unsigned char>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

// 32-bit float stereo with a LIST chunk ahead of fmt, as some recorders write
std::vector<unsigned char> float_stereo_wav(const std::vector<float>& interleaved, int rate) {
    std::vector<unsigned char> out;
    append_tag(out, "RIFF");
    append_u32(out, 0);
    append_tag(out, "WAVE");

    append_tag(out, "LIST");
    append_u32(out, 5);
    out.insert(out.end(), {'I', 'N', 'F', 'O', 'x', 0});  // Odd size plus pad byte

    append_tag(out, "fmt ");
    append_u32(out, 16);
    append_u16(out, 3);
    append_u16(out, 2);
    append_u32(out, rate);
    append_u32(out, rate * 8);
    append_u16(out, 8);
    append_u16(out, 32);

    append_tag(out, "data");
    append_u32(out, static_cast<uint32_t>(interleaved.size() * 4));
    const auto* raw = reinterpret_cast<const unsigned char*>(interleaved.data());
    out.insert(out.end(), raw, raw + interleaved.size() * 4);
    return out;
}

void test_pcm16_file() {
    std::cout << "Testing 16-bit PCM..." << std::endl;

    std::string dir = make_test_dir("wav_pcm");
    std::string path = (fs::path(dir) / "tone.wav").string();

    std::vector<float> samples = {0.0f, 0.5f, -0.5f, 1.0f, -1.0f, 2.0f};
    assert(write_wav(path, samples, 16000, 1));
    assert(fs::file_size(path) == WAV_HEADER_SIZE + samples.size() * 2);

    WavData wav;
    std::string error;
    assert(read_wav(path, wav, error));
    assert(wav.sample_rate == 16000);
    assert(wav.channels == 1);
    assert(wav.frame_count() == samples.size());
    assert(std::fabs(wav.samples[1] - 0.5f) < 1e-3f);
    assert(std::fabs(wav.samples[2] + 0.5f) < 1e-3f);
    assert(std::fabs(wav.samples[5] - wav.samples[3]) < 1e-6f && "Out of range input is clamped");

    assert(!read_wav((fs::path(dir) / "missing.wav").string(), wav, error));

    fs::remove_all(dir);
    std::cout << "  PASS: Written header and samples read back" << std::endl;
}

void test_float_stereo_to_whisper_input() {
    std::cout << "Testing float stereo conversion..." << std::endl;

    // Left and right average to 0.25 everywhere
    std::vector<float> interleaved;
    for (int i = 0; i < 4800; ++i) {
        interleaved.push_back(0.5f);
        interleaved.push_back(0.0f);
    }

    WavData wav;
    std::string error;
    assert(decode_wav(float_stereo_wav(interleaved, 48000), wav, error));
    assert(wav.channels == 2);
    assert(wav.sample_rate == 48000);
    assert(wav.frame_count() == 4800);

    auto mono = to_mono(wav, 16000);
    assert(mono.size() == 1600);
    for (float s : mono) {
        assert(std::fabs(s - 0.25f) < 1e-6f);
    }

    std::cout << "  PASS: Unknown chunks skipped, 48kHz stereo became 16kHz mono" << std::endl;
}

void test_resample_interpolates() {
    std::cout << "Testing resampling..." << std::endl;

    WavData ramp;
    ramp.sample_rate = 8000;
    ramp.channels = 1;
    ramp.samples = {0.0f, 0.2f, 0.4f, 0.6f};

    auto up = to_mono(ramp, 16000);
    assert(up.size() == 8);
    assert(std::fabs(up[1] - 0.1f) < 1e-6f);
    assert(std::fabs(up[6] - 0.6f) < 1e-6f);

    WavData empty;
    assert(to_mono(empty, 16000).empty());

    std::cout << "  PASS: Linear interpolation between frames" << std::endl;
}

void test_rejects_bad_input() {
    std::cout << "Testing invalid WAV data..." << std::endl;

    WavData wav;
    std::string error;

    std::vector<unsigned char> text = {'h', 'e', 'l', 'l', 'o', ' ', 'w', 'o', 'r', 'l', 'd', '!'};
    assert(!decode_wav(text, wav, error));
    assert(error == "Not a RIFF/WAVE file");

    auto header_only = encode_wav({}, 16000, 1);
    header_only.resize(36);
    assert(!decode_wav(header_only, wav, error));
    assert(error == "WAV file has no data chunk");

    auto eight_bit = encode_wav({0.1f, 0.2f}, 16000, 1);
    eight_bit[34] = 8;
    assert(!decode_wav(eight_bit, wav, error));
    assert(error.find("Unsupported") != std::string::npos);

    std::cout << "  PASS: Non-WAV, truncated and unsupported files rejected" << std::endl;
}

int main() {
    std::cout << "=== WAV File Test Suite ===" << std::endl;

    test_pcm16_file();
    test_float_stereo_to_whisper_input();
    test_resample_interpolates();
    test_rejects_bad_input();

    std::cout << "\n=== All Tests Passed! ===" << std::endl;
    return 0;
}
