/**
 * @file assembler.h
 * @brief Ordered reassembly of a session's chunks into the final object
 */

#ifndef KCENON_CHUNKED_UPLOAD_SERVER_ASSEMBLER_H
#define KCENON_CHUNKED_UPLOAD_SERVER_ASSEMBLER_H

#include <kcenon/chunked_upload/core/protocol_types.h>
#include <kcenon/chunked_upload/core/types.h>
#include <kcenon/chunked_upload/server/output_store.h>
#include <kcenon/chunked_upload/server/session_registry.h>
#include <kcenon/chunked_upload/server/temp_store.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace kcenon::chunked_upload {

/**
 * @brief Turn a client-supplied name into a single safe path component
 *
 * Characters in <>:"/\|?*[] and control characters become '_', as does
 * every run of two or more dots. An empty result, or ".", becomes "_".
 */
[[nodiscard]] auto sanitize_object_name(std::string_view name) -> std::string;

/**
 * @brief Concatenates parts 0..N-1 in index order and commits the object
 *
 * Nothing is written unless every part is present. On success the chunk
 * records, the temp area and the session itself are removed, so a second
 * finalize of the same session reports session_not_found.
 */
class assembler {
public:
    assembler(std::shared_ptr<session_registry> registry,
              std::shared_ptr<temp_store> temp,
              std::shared_ptr<output_store> output);

    /**
     * @brief Assemble and commit the object of @p session_id
     *
     * @param total_chunks Number of parts the client sent, non-zero
     * @param object_name Name to commit under, sanitized first
     * @return Final location and names, or
     *         - invalid_argument for zero chunks or an empty name
     *         - session_not_found for an unknown or finished session
     *         - missing_chunk with the first absent index; the session stays open
     *         - size_mismatch when the parts do not add up to the declared
     *           size; the session stays open
     */
    [[nodiscard]] auto finalize(std::string_view session_id,
                                uint32_t total_chunks,
                                const std::string& object_name) -> result<finalize_response>;

private:
    std::shared_ptr<session_registry> registry_;
    std::shared_ptr<temp_store> temp_;
    std::shared_ptr<output_store> output_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_SERVER_ASSEMBLER_H
