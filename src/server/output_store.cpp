/**
 * @file output_store.cpp
 * @brief Filesystem implementation of the output store
 */

#include <kcenon/chunked_upload/server/output_store.h>

#include <kcenon/chunked_upload/core/session_id.h>

namespace kcenon::chunked_upload {

namespace {

class filesystem_output_writer : public output_writer {
public:
    filesystem_output_writer(std::filesystem::path root, std::filesystem::path temp_path)
        : root_(std::move(root)), temp_path_(std::move(temp_path)),
          file_(temp_path_, std::ios::binary | std::ios::trunc) {}

    ~filesystem_output_writer() override {
        if (!committed_) {
            discard();
        }
    }

    [[nodiscard]] auto is_open() const -> bool { return file_.is_open(); }

    auto append(std::span<const std::byte> data) -> result<void> override {
        if (committed_ || !file_.is_open()) {
            return unexpected(error(error_code::invalid_state, "output is closed"));
        }
        file_.write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()));
        if (!file_) {
            return unexpected(error(error_code::file_write_error,
                                    "write failed for " + temp_path_.string()));
        }
        written_ += data.size();
        return {};
    }

    [[nodiscard]] auto bytes_written() const -> uint64_t override { return written_; }

    auto commit(const std::string& name) -> result<std::filesystem::path> override {
        if (committed_ || !file_.is_open()) {
            return unexpected(error(error_code::invalid_state, "output is closed"));
        }

        auto target = (root_ / name).lexically_normal();
        if (name.empty() || target.parent_path() != (root_ / "").lexically_normal().parent_path() ||
            target.filename() != std::filesystem::path(name)) {
            return unexpected(error(error_code::invalid_argument,
                                    "object name escapes the upload directory"));
        }

        file_.flush();
        file_.close();
        if (file_.fail()) {
            return unexpected(error(error_code::file_write_error,
                                    "cannot flush " + temp_path_.string()));
        }

        std::error_code ec;
        if (std::filesystem::is_regular_file(target, ec)) {
            std::filesystem::remove(target, ec);
        }
        std::filesystem::rename(temp_path_, target, ec);
        if (ec) {
            return unexpected(error(error_code::file_write_error,
                                    "cannot rename temp file: " + ec.message()));
        }

        committed_ = true;
        return target;
    }

    void discard() override {
        if (file_.is_open()) {
            file_.close();
        }
        std::error_code ec;
        std::filesystem::remove(temp_path_, ec);
    }

private:
    std::filesystem::path root_;
    std::filesystem::path temp_path_;
    std::ofstream file_;
    uint64_t written_ = 0;
    bool committed_ = false;
};

}  // namespace

filesystem_output_store::filesystem_output_store(std::filesystem::path root)
    : root_(std::move(root)) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
}

auto filesystem_output_store::begin() -> result<std::unique_ptr<output_writer>> {
    auto suffix = random_hex(8);
    if (!suffix) {
        return unexpected(suffix.error());
    }

    auto writer = std::make_unique<filesystem_output_writer>(
        root_, root_ / (".tmp_" + suffix.value()));
    if (!writer->is_open()) {
        return unexpected(error(error_code::file_write_error,
                                "cannot create temp output in " + root_.string()));
    }
    return std::unique_ptr<output_writer>(std::move(writer));
}

}  // namespace kcenon::chunked_upload
