/**
 * @file output_store.h
 * @brief Destination for assembled objects
 */

#ifndef KCENON_CHUNKED_UPLOAD_SERVER_OUTPUT_STORE_H
#define KCENON_CHUNKED_UPLOAD_SERVER_OUTPUT_STORE_H

#include <kcenon/chunked_upload/core/types.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief One object being written
 *
 * Bytes are appended to a hidden temporary and only become visible under
 * their final name on commit(). A writer destroyed without commit()
 * discards what it wrote.
 */
class output_writer {
public:
    virtual ~output_writer() = default;

    [[nodiscard]] virtual auto append(std::span<const std::byte> data) -> result<void> = 0;

    [[nodiscard]] virtual auto bytes_written() const -> uint64_t = 0;

    /**
     * @brief Publish the object as @p name, replacing an existing object
     * @param name A single path component
     * @return Final location
     */
    [[nodiscard]] virtual auto commit(const std::string& name)
        -> result<std::filesystem::path> = 0;

    virtual void discard() = 0;
};

class output_store {
public:
    virtual ~output_store() = default;

    [[nodiscard]] virtual auto begin() -> result<std::unique_ptr<output_writer>> = 0;
};

/**
 * @brief output_store writing into one directory
 *
 * Temporaries are named ".tmp_<16 hex>" inside the same directory so the
 * commit is a rename on one filesystem.
 */
class filesystem_output_store : public output_store {
public:
    explicit filesystem_output_store(std::filesystem::path root);

    [[nodiscard]] auto begin() -> result<std::unique_ptr<output_writer>> override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    std::filesystem::path root_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_SERVER_OUTPUT_STORE_H
