/**
 * @file validity.hpp
 * @brief Acceptance gate for merge outputs
 *
 * @details A merge output counts as present only if it exists, is at least
 *          the configured size, and (with deep checking) can be probed by
 *          the transcoder. The same predicate decides both "is this bucket
 *          already done" and "did this attempt succeed".
 */

#ifndef CAM_MERGE_VALIDITY_HPP
#define CAM_MERGE_VALIDITY_HPP

#include <cstdint>
#include <filesystem>

namespace cam_merge {

class Transcoder;

/**
 * @brief Check whether @p path is an acceptable merge output.
 *
 * @param path Candidate output file
 * @param min_size_kb Minimum size in KB (1 KB = 1024 bytes)
 * @param deep Also run the transcoder's probe (30s hard timeout)
 * @param transcoder Probe provider, only used when @p deep is set
 * @return true if every enabled check passes
 */
bool is_valid_output(const std::filesystem::path &path,
                     std::uint64_t min_size_kb, bool deep,
                     Transcoder &transcoder);

} // namespace cam_merge

#endif // CAM_MERGE_VALIDITY_HPP
