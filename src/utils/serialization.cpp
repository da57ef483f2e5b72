#include "utils/serialization.hpp"
#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>

namespace SpecOpt {
namespace Utils {

namespace {

std::array<uint32_t, 256> make_crc_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

const std::array<uint32_t, 256>& crc_table() {
    static const std::array<uint32_t, 256> table = make_crc_table();
    return table;
}

// Sanity limit for length prefixes read from disk
constexpr uint32_t MAX_ELEMENTS = 1u << 28;

} // namespace

void Serialization::require(std::istream& in, const char* what) {
    if (!in) {
        throw std::runtime_error(std::string("Unexpected end of checkpoint while reading ") + what);
    }
}

void Serialization::write_header(std::ostream& out, const std::string& kind) {
    if (kind.size() != 4) {
        throw std::invalid_argument("Checkpoint kind tag must be 4 characters: " + kind);
    }
    out.write(MAGIC, 5);
    write_u32(out, VERSION);
    out.write(kind.data(), 4);
}

uint32_t Serialization::read_header(std::istream& in, const std::string& expected_kind) {
    char magic[5];
    in.read(magic, 5);
    require(in, "magic");
    if (std::memcmp(magic, MAGIC, 5) != 0) {
        throw std::runtime_error("Not a SpecOpt checkpoint (bad magic)");
    }

    uint32_t version = read_u32(in);
    if (version == 0 || version > VERSION) {
        throw std::runtime_error("Unsupported checkpoint version " + std::to_string(version));
    }

    char kind[4];
    in.read(kind, 4);
    require(in, "kind");
    if (std::string(kind, 4) != expected_kind) {
        throw std::runtime_error("Checkpoint kind '" + std::string(kind, 4) + "' where '" +
                                 expected_kind + "' was expected");
    }
    return version;
}

void Serialization::write_u32(std::ostream& out, uint32_t value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(uint32_t));
}

uint32_t Serialization::read_u32(std::istream& in) {
    uint32_t value = 0;
    in.read(reinterpret_cast<char*>(&value), sizeof(uint32_t));
    require(in, "uint32");
    return value;
}

void Serialization::write_i32(std::ostream& out, int32_t value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(int32_t));
}

int32_t Serialization::read_i32(std::istream& in) {
    int32_t value = 0;
    in.read(reinterpret_cast<char*>(&value), sizeof(int32_t));
    require(in, "int32");
    return value;
}

void Serialization::write_u64(std::ostream& out, uint64_t value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(uint64_t));
}

uint64_t Serialization::read_u64(std::istream& in) {
    uint64_t value = 0;
    in.read(reinterpret_cast<char*>(&value), sizeof(uint64_t));
    require(in, "uint64");
    return value;
}

void Serialization::write_f32(std::ostream& out, float value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(float));
}

float Serialization::read_f32(std::istream& in) {
    float value = 0.0f;
    in.read(reinterpret_cast<char*>(&value), sizeof(float));
    require(in, "float");
    return value;
}

void Serialization::write_string(std::ostream& out, const std::string& value) {
    write_u32(out, static_cast<uint32_t>(value.size()));
    out.write(value.data(), static_cast<std::streamsize>(value.size()));
}

std::string Serialization::read_string(std::istream& in) {
    uint32_t size = read_u32(in);
    if (size > MAX_ELEMENTS) {
        throw std::runtime_error("Corrupt string length in checkpoint");
    }
    std::string value(size, '\0');
    in.read(&value[0], size);
    require(in, "string");
    return value;
}

void Serialization::write_matrix(std::ostream& out, const Math::IMatrix& matrix) {
    write_u32(out, static_cast<uint32_t>(matrix.rows()));
    write_u32(out, static_cast<uint32_t>(matrix.cols()));
    out.write(reinterpret_cast<const char*>(matrix.data()),
              static_cast<std::streamsize>(matrix.size() * sizeof(float)));
}

std::pair<uint32_t, uint32_t> Serialization::read_matrix_dims(std::istream& in) {
    uint32_t rows = read_u32(in);
    uint32_t cols = read_u32(in);
    return {rows, cols};
}

void Serialization::read_matrix(std::istream& in, Math::IMatrix& matrix) {
    auto dims = read_matrix_dims(in);
    if (dims.first != matrix.rows() || dims.second != matrix.cols()) {
        throw std::runtime_error("Matrix shape mismatch: stored (" + std::to_string(dims.first) + "x" +
                                 std::to_string(dims.second) + "), expected (" +
                                 std::to_string(matrix.rows()) + "x" + std::to_string(matrix.cols()) + ")");
    }
    in.read(reinterpret_cast<char*>(matrix.data()),
            static_cast<std::streamsize>(matrix.size() * sizeof(float)));
    require(in, "matrix data");
}

uint32_t Serialization::update_crc(uint32_t crc, const uint8_t* data, size_t len) {
    const auto& table = crc_table();
    for (size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
    }
    return crc;
}

uint32_t Serialization::compute_checksum(const std::string& filepath, size_t num_bytes) {
    std::ifstream in(filepath, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open file for checksum: " + filepath);
    }

    size_t remaining = num_bytes == 0 ? get_file_size(filepath) : num_bytes;
    uint32_t crc = 0xFFFFFFFFu;
    std::vector<uint8_t> buffer(1 << 16);

    while (remaining > 0) {
        size_t chunk = std::min(remaining, buffer.size());
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk));
        size_t got = static_cast<size_t>(in.gcount());
        if (got == 0) {
            break;
        }
        crc = update_crc(crc, buffer.data(), got);
        remaining -= got;
    }

    return crc ^ 0xFFFFFFFFu;
}

void Serialization::append_checksum(const std::string& filepath) {
    uint32_t crc = compute_checksum(filepath);
    std::ofstream out(filepath, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot append checksum to: " + filepath);
    }
    write_u32(out, crc);
    if (!out) {
        throw std::runtime_error("Failed writing checksum to: " + filepath);
    }
}

bool Serialization::validate_checksum(const std::string& filepath) {
    size_t size = get_file_size(filepath);
    if (size < sizeof(uint32_t)) {
        return false;
    }

    uint32_t expected = compute_checksum(filepath, size - sizeof(uint32_t));

    std::ifstream in(filepath, std::ios::binary);
    in.seekg(static_cast<std::streamoff>(size - sizeof(uint32_t)));
    uint32_t stored = 0;
    in.read(reinterpret_cast<char*>(&stored), sizeof(uint32_t));
    if (!in) {
        return false;
    }
    return stored == expected;
}

size_t Serialization::get_file_size(const std::string& filepath) {
    struct stat st;
    if (stat(filepath.c_str(), &st) != 0) {
        return 0;
    }
    return static_cast<size_t>(st.st_size);
}

void Serialization::write_file_atomic(const std::string& path,
                                      const std::function<void(std::ostream&)>& writer) {
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path());
    }

    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot open for writing: " + tmp);
        }
        writer(out);
        out.flush();
        if (!out) {
            throw std::runtime_error("Failed writing: " + tmp);
        }
    }
    append_checksum(tmp);

    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::remove(tmp.c_str());
        throw std::runtime_error("Cannot move " + tmp + " to " + path);
    }
}

} // namespace Utils
} // namespace SpecOpt
