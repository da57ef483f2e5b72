#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <cstdint>
#include <functional>
#include <vector>
#include "math/matrix_interface.hpp"

namespace SpecOpt {
namespace Utils {

/**
 * Binary I/O for checkpoints (reward model, policy, trainer state)
 *
 * File layout:
 *   [magic "SPOPT"][version: uint32][kind: 4 chars] ... sections ... [crc32: uint32]
 *
 * Every reader throws std::runtime_error on truncated or malformed input;
 * callers translate that into their own error type.
 */
class Serialization {
public:
    static constexpr const char* MAGIC = "SPOPT";
    static constexpr uint32_t VERSION = 1;

    // Four-character section tags
    static constexpr const char* KIND_REWARD_MODEL = "RWDM";
    static constexpr const char* KIND_POLICY = "PLCY";

    /**
     * Write file header with magic number, version and kind tag
     */
    static void write_header(std::ostream& out, const std::string& kind);

    /**
     * Read and validate file header
     * @return version number if valid, throws if magic/kind do not match
     */
    static uint32_t read_header(std::istream& in, const std::string& expected_kind);

    static void write_u32(std::ostream& out, uint32_t value);
    static uint32_t read_u32(std::istream& in);
    static void write_i32(std::ostream& out, int32_t value);
    static int32_t read_i32(std::istream& in);
    static void write_u64(std::ostream& out, uint64_t value);
    static uint64_t read_u64(std::istream& in);
    static void write_f32(std::ostream& out, float value);
    static float read_f32(std::istream& in);

    /**
     * Length-prefixed string: [size: uint32_t][bytes]
     */
    static void write_string(std::ostream& out, const std::string& value);
    static std::string read_string(std::istream& in);

    /**
     * Write a matrix: [rows: uint32_t][cols: uint32_t][data: float array]
     */
    static void write_matrix(std::ostream& out, const Math::IMatrix& matrix);

    /**
     * Read a matrix into an existing one; stored dims must match exactly
     */
    static void read_matrix(std::istream& in, Math::IMatrix& matrix);

    /**
     * Read matrix dimensions without the data
     */
    static std::pair<uint32_t, uint32_t> read_matrix_dims(std::istream& in);

    /**
     * CRC32 of the first num_bytes of a file (0 = entire file)
     */
    static uint32_t compute_checksum(const std::string& filepath, size_t num_bytes = 0);

    /**
     * Append CRC32 of the current file contents as its last four bytes
     */
    static void append_checksum(const std::string& filepath);

    /**
     * True if the trailing four bytes match the CRC32 of everything before them
     */
    static bool validate_checksum(const std::string& filepath);

    static size_t get_file_size(const std::string& filepath);

    /**
     * Write through writer into "<path>.tmp", append the CRC32 trailer and
     * rename over path. Readers never observe a partial file.
     */
    static void write_file_atomic(const std::string& path,
                                  const std::function<void(std::ostream&)>& writer);

private:
    static uint32_t update_crc(uint32_t crc, const uint8_t* data, size_t len);
    static void require(std::istream& in, const char* what);
};

} // namespace Utils
} // namespace SpecOpt
