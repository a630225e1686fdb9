#include "wav_file.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>

namespace voxchord {

namespace {

void put_u16(std::vector<unsigned char>& out, uint16_t v) {
    out.push_back(static_cast<unsigned char>(v & 0xFF));
    out.push_back(static_cast<unsigned char>((v >> 8) & 0xFF));
}

void put_u32(std::vector<unsigned char>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<unsigned char>((v >> (8 * i)) & 0xFF));
    }
}

uint16_t get_u16(const unsigned char* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t get_u32(const unsigned char* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace

std::vector<unsigned char> encode_wav(const std::vector<float>& samples,
                                      int sample_rate, int channels) {
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<unsigned char> out;
    out.reserve(WAV_HEADER_SIZE + data_size);

    out.insert(out.end(), {'R', 'I', 'F', 'F'});
    put_u32(out, 36 + data_size);
    out.insert(out.end(), {'W', 'A', 'V', 'E'});

    out.insert(out.end(), {'f', 'm', 't', ' '});
    put_u32(out, 16);
    put_u16(out, 1);  // PCM
    put_u16(out, static_cast<uint16_t>(channels));
    put_u32(out, static_cast<uint32_t>(sample_rate));
    put_u32(out, static_cast<uint32_t>(sample_rate * channels * sizeof(int16_t)));
    put_u16(out, static_cast<uint16_t>(channels * sizeof(int16_t)));
    put_u16(out, 16);

    out.insert(out.end(), {'d', 'a', 't', 'a'});
    put_u32(out, data_size);

    for (float s : samples) {
        float clamped = std::max(-1.0f, std::min(1.0f, s));
        put_u16(out, static_cast<uint16_t>(static_cast<int16_t>(std::lround(clamped * 32767.0f))));
    }
    return out;
}

bool write_wav(const std::string& path, const std::vector<float>& samples,
               int sample_rate, int channels) {
    auto bytes = encode_wav(samples, sample_rate, channels);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) return false;
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(file);
}

bool decode_wav(const std::vector<unsigned char>& bytes, WavData& out, std::string& error) {
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        error = "Not a RIFF/WAVE file";
        return false;
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;
    bool have_fmt = false;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const unsigned char* chunk = bytes.data() + pos;
        uint32_t size = get_u32(chunk + 4);
        size_t body = pos + 8;
        size_t available = std::min<size_t>(size, bytes.size() - body);

        if (std::memcmp(chunk, "fmt ", 4) == 0 && available >= 16) {
            format = get_u16(bytes.data() + body);
            channels = get_u16(bytes.data() + body + 2);
            sample_rate = get_u32(bytes.data() + body + 4);
            bits = get_u16(bytes.data() + body + 14);
            // WAVE_FORMAT_EXTENSIBLE carries the real format in the sub-GUID
            if (format == 0xFFFE && available >= 26) {
                format = get_u16(bytes.data() + body + 24);
            }
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!have_fmt || channels == 0) {
                error = "WAV data chunk before fmt chunk";
                return false;
            }

            out.sample_rate = static_cast<int>(sample_rate);
            out.channels = channels;
            out.samples.clear();

            const unsigned char* data = bytes.data() + body;
            if (format == 1 && bits == 16) {
                size_t n = available / 2;
                out.samples.reserve(n);
                for (size_t i = 0; i < n; ++i) {
                    int16_t v = static_cast<int16_t>(get_u16(data + 2 * i));
                    out.samples.push_back(v / 32768.0f);
                }
            } else if (format == 3 && bits == 32) {
                size_t n = available / 4;
                out.samples.resize(n);
                std::memcpy(out.samples.data(), data, n * 4);
            } else {
                error = "Unsupported WAV encoding (format " + std::to_string(format) +
                        ", " + std::to_string(bits) + " bits)";
                return false;
            }
            return true;
        }

        // Chunks are word aligned
        pos = body + size + (size & 1);
    }

    error = "WAV file has no data chunk";
    return false;
}

bool read_wav(const std::string& path, WavData& out, std::string& error) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        error = "Cannot open " + path;
        return false;
    }
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(file)),
                                     std::istreambuf_iterator<char>());
    return decode_wav(bytes, out, error);
}

std::vector<float> to_mono(const WavData& wav, int target_rate) {
    if (wav.channels <= 0 || wav.sample_rate <= 0) return {};

    const size_t frames = wav.frame_count();
    std::vector<float> mono(frames);
    for (size_t f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (int c = 0; c < wav.channels; ++c) {
            sum += wav.samples[f * wav.channels + c];
        }
        mono[f] = sum / wav.channels;
    }

    if (wav.sample_rate == target_rate || mono.empty()) return mono;

    const double ratio = static_cast<double>(wav.sample_rate) / target_rate;
    const size_t out_frames = static_cast<size_t>(frames / ratio);
    std::vector<float> out(out_frames);
    for (size_t i = 0; i < out_frames; ++i) {
        double src = i * ratio;
        size_t i0 = static_cast<size_t>(src);
        size_t i1 = std::min(i0 + 1, frames - 1);
        float t = static_cast<float>(src - i0);
        out[i] = mono[i0] * (1.0f - t) + mono[i1] * t;
    }
    return out;
}

} // namespace voxchord
