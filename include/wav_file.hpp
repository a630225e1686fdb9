#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace voxchord {

constexpr std::size_t WAV_HEADER_SIZE = 44;

struct WavData {
    int sample_rate = 0;
    int channels = 0;
    std::vector<float> samples;     // Interleaved, normalized to [-1, 1]

    std::size_t frame_count() const {
        return channels > 0 ? samples.size() / channels : 0;
    }
};

// 16-bit PCM RIFF/WAVE with the canonical 44-byte header
bool write_wav(const std::string& path, const std::vector<float>& samples,
               int sample_rate, int channels);

std::vector<unsigned char> encode_wav(const std::vector<float>& samples,
                                      int sample_rate, int channels);

// Reads 16-bit PCM or 32-bit float WAV. Skips unknown chunks.
bool read_wav(const std::string& path, WavData& out, std::string& error);
bool decode_wav(const std::vector<unsigned char>& bytes, WavData& out, std::string& error);

// Downmix to mono and linearly resample, for Whisper's 16kHz input
std::vector<float> to_mono(const WavData& wav, int target_rate);

} // namespace voxchord
