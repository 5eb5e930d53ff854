/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef CHUNK_RELAY_BENCHMARKS_BENCHMARK_HELPERS_H
#define CHUNK_RELAY_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace chunk_relay::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @param base_dir Base directory for temporary files, a fresh directory when empty
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with random data
     * @return Path to created file
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_object = 256 * KB;
constexpr std::size_t medium_object = 16 * MB;
constexpr std::size_t large_object = 64 * MB;

constexpr std::size_t small_chunk = 256 * KB;
constexpr std::size_t default_chunk = 4 * MB;
constexpr std::size_t large_chunk = 16 * MB;
}  // namespace sizes

}  // namespace chunk_relay::benchmark

#endif  // CHUNK_RELAY_BENCHMARKS_BENCHMARK_HELPERS_H
