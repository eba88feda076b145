#pragma once

#include "CrossRefErrors.hpp"
#include "CrossRefPipeline.hpp"

// minizip-ng
#include <minizip-ng/mz.h>
#include <minizip-ng/mz_zip.h>
#include <minizip-ng/mz_zip_rw.h>
#include <minizip-ng/mz_strm.h>
#include <minizip-ng/mz_strm_mem.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace autocref::docx {
    inline constexpr auto DOCUMENT_PART = "word/document.xml";
    inline constexpr auto FOOTNOTES_PART = "word/footnotes.xml";

    // Entries above this size are refused rather than loaded.
    inline constexpr int64_t MAX_ENTRY_BYTES = 256LL * 1024LL * 1024LL;

    struct Entry {
        std::string name;
        bool isDir = false;
        std::vector<uint8_t> data;
        uint16_t compressionMethod = MZ_COMPRESS_METHOD_DEFLATE;
        std::time_t modifiedDate = 0;
        uint32_t externalAttributes = 0;
    };

    namespace detail {
        inline std::string rcMessage(const char *what, const int32_t rc) {
            return std::string("minizip: ") + what + " failed rc=" + std::to_string(rc);
        }

        // Minimal gate on entry names; the package is never extracted to disk,
        // but a name like this is a sign of a crafted archive.
        inline bool IsSafeZipEntryName(const std::string &name) {
            if (name.empty()) return false;
            if (name.front() == '/' || name.front() == '\\') return false;
            if (name.find('\0') != std::string::npos) return false;
            if (name.find('\\') != std::string::npos) return false;

            // only a path part that is exactly ".." climbs out
            std::string_view rest(name);
            while (true) {
                const size_t slash = rest.find('/');
                if (rest.substr(0, slash) == "..") return false;
                if (slash == std::string_view::npos) return true;
                rest.remove_prefix(slash + 1);
            }
        }

        // ============================================================
        //  RAII wrappers: memory stream, zip reader, zip writer
        // ============================================================
        class MemStream {
        public:
            MemStream() : handle_(mz_stream_mem_create()) {
                if (!handle_)
                    throw PackageError("minizip: failed to create memory stream.");
            }

            ~MemStream() {
                if (open_)
                    mz_stream_close(handle_);
                mz_stream_mem_delete(&handle_);
            }

            MemStream(const MemStream &) = delete;

            MemStream &operator=(const MemStream &) = delete;

            // |bytes| must outlive the stream.
            void OpenRead(const std::vector<uint8_t> &bytes) {
                if (bytes.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max()))
                    throw PackageError("Package is too large to read in memory.");

                mz_stream_mem_set_buffer(handle_,
                                         const_cast<uint8_t *>(bytes.data()),
                                         static_cast<int32_t>(bytes.size()));

                if (const int32_t rc = mz_stream_open(handle_, nullptr, MZ_OPEN_MODE_READ); rc != MZ_OK)
                    throw PackageError(rcMessage("stream_open(READ)", rc));
                open_ = true;
                mz_stream_seek(handle_, 0, MZ_SEEK_SET);
            }

            void OpenCreate(const int32_t growSize = 64 * 1024) {
                mz_stream_mem_set_grow_size(handle_, growSize);

                if (const int32_t rc = mz_stream_open(handle_, nullptr, MZ_OPEN_MODE_CREATE); rc != MZ_OK)
                    throw PackageError(rcMessage("stream_open(CREATE)", rc));
                open_ = true;
                mz_stream_seek(handle_, 0, MZ_SEEK_SET);
            }

            // Copy the written bytes out while the stream is still alive.
            [[nodiscard]] std::vector<uint8_t> CopyBuffer() const {
                const void *buf = nullptr;
                mz_stream_mem_get_buffer(handle_, &buf);

                int32_t length = 0;
                mz_stream_mem_get_buffer_length(handle_, &length);

                if (!buf || length <= 0)
                    throw PackageError("Output ZIP buffer is empty (unexpected).");

                std::vector<uint8_t> bytes(static_cast<size_t>(length));
                std::memcpy(bytes.data(), buf, bytes.size());
                return bytes;
            }

            [[nodiscard]] void *Get() const noexcept { return handle_; }

        private:
            void *handle_;
            bool open_ = false;
        };

        class ZipReader {
        public:
            explicit ZipReader(const MemStream &stream) : handle_(mz_zip_reader_create()) {
                if (!handle_)
                    throw PackageError("minizip: failed to create zip reader.");

                if (const int32_t rc = mz_zip_reader_open(handle_, stream.Get()); rc != MZ_OK) {
                    mz_zip_reader_delete(&handle_);
                    throw PackageError("Failed to open ZIP archive from memory rc=" + std::to_string(rc));
                }
            }

            ~ZipReader() {
                mz_zip_reader_close(handle_);
                mz_zip_reader_delete(&handle_);
            }

            ZipReader(const ZipReader &) = delete;

            ZipReader &operator=(const ZipReader &) = delete;

            [[nodiscard]] void *Get() const noexcept { return handle_; }

        private:
            void *handle_;
        };

        class ZipWriter {
        public:
            explicit ZipWriter(const MemStream &stream) : handle_(mz_zip_writer_create()) {
                if (!handle_)
                    throw PackageError("minizip: failed to create zip writer.");

                if (const int32_t rc = mz_zip_writer_open(handle_, stream.Get(), 0); rc != MZ_OK) {
                    mz_zip_writer_delete(&handle_);
                    throw PackageError(rcMessage("writer_open", rc));
                }
                open_ = true;

                mz_zip_writer_set_compress_method(handle_, MZ_COMPRESS_METHOD_DEFLATE);
                mz_zip_writer_set_compress_level(handle_, MZ_COMPRESS_LEVEL_DEFAULT);
            }

            ~ZipWriter() {
                // only reached without Close() when unwinding from an error
                if (open_)
                    mz_zip_writer_close(handle_);
                mz_zip_writer_delete(&handle_);
            }

            ZipWriter(const ZipWriter &) = delete;

            ZipWriter &operator=(const ZipWriter &) = delete;

            void Add(const Entry &e) {
                // stored entries stay stored, everything else is deflated
                const uint16_t method = e.compressionMethod == MZ_COMPRESS_METHOD_STORE
                                            ? MZ_COMPRESS_METHOD_STORE
                                            : MZ_COMPRESS_METHOD_DEFLATE;

                mz_zip_file file_info = {};
                file_info.filename = e.name.c_str();
                file_info.flag |= MZ_ZIP_FLAG_UTF8;
                file_info.uncompressed_size = static_cast<int64_t>(e.data.size());
                file_info.compression_method = method;
                file_info.modified_date = e.modifiedDate;
                file_info.external_fa = e.externalAttributes;

                mz_zip_writer_set_compress_method(handle_, method);
                mz_zip_writer_set_compress_level(handle_,
                                                 method == MZ_COMPRESS_METHOD_STORE ? 0 : MZ_COMPRESS_LEVEL_DEFAULT);

                const int32_t rc = mz_zip_writer_add_buffer(handle_,
                                                            e.data.empty()
                                                                ? nullptr
                                                                : const_cast<uint8_t *>(e.data.data()),
                                                            static_cast<int32_t>(e.data.size()),
                                                            &file_info);
                if (rc != MZ_OK)
                    throw PackageError("minizip: add_buffer(" + e.name + ") failed rc=" + std::to_string(rc));
            }

            void Close() {
                open_ = false;
                if (const int32_t rc = mz_zip_writer_close(handle_); rc != MZ_OK)
                    throw PackageError(rcMessage("writer_close", rc));
            }

        private:
            void *handle_;
            bool open_ = false;
        };
    } // namespace detail

    // ============================================================
    //  Package: every entry of a .docx held in memory
    // ============================================================
    class Package {
    public:
        // Read all entries of a ZIP image. Throws PackageError.
        static Package FromBytes(const std::vector<uint8_t> &inputZipBytes) {
            if (inputZipBytes.empty())
                throw PackageError("Input ZIP buffer is empty.");

            detail::MemStream stream;
            stream.OpenRead(inputZipBytes);
            const detail::ZipReader reader(stream);

            Package package;
            package.entries_.reserve(64);

            if (const int32_t rc = mz_zip_reader_goto_first_entry(reader.Get()); rc != MZ_OK)
                throw PackageError("ZIP has no readable entries (rc=" + std::to_string(rc) + ")");

            int32_t rc_next = MZ_OK;
            do {
                mz_zip_file *file_info = nullptr;
                if (const int32_t rc = mz_zip_reader_entry_get_info(reader.Get(), &file_info);
                    rc != MZ_OK || !file_info || !file_info->filename)
                    throw PackageError(detail::rcMessage("entry_get_info", rc));

                Entry e;
                e.name = file_info->filename;
                e.compressionMethod = file_info->compression_method;
                e.modifiedDate = file_info->modified_date;
                e.externalAttributes = file_info->external_fa;

                if (!detail::IsSafeZipEntryName(e.name))
                    throw PackageError("Refusing package with unsafe entry name: " + e.name);

                e.isDir = (mz_zip_reader_entry_is_dir(reader.Get()) == MZ_OK) ||
                          (!e.name.empty() && e.name.back() == '/');

                if (!e.isDir) {
                    const int64_t usize64 = file_info->uncompressed_size;
                    if (usize64 < 0 || usize64 > MAX_ENTRY_BYTES)
                        throw PackageError("Unreasonable entry size (" + e.name + ") size=" +
                                           std::to_string(usize64));

                    e.data.resize(static_cast<size_t>(usize64));

                    if (const int32_t rc = mz_zip_reader_entry_open(reader.Get()); rc != MZ_OK)
                        throw PackageError("minizip: entry_open(" + e.name + ") failed rc=" + std::to_string(rc));

                    int32_t rc_save = MZ_OK;
                    if (!e.data.empty()) {
                        rc_save = mz_zip_reader_entry_save_buffer(reader.Get(),
                                                                  e.data.data(),
                                                                  static_cast<int32_t>(e.data.size()));
                    }
                    mz_zip_reader_entry_close(reader.Get());

                    if (rc_save != MZ_OK)
                        throw PackageError("minizip: save_buffer(" + e.name + ") failed rc=" +
                                           std::to_string(rc_save));
                }

                package.entries_.push_back(std::move(e));
                rc_next = mz_zip_reader_goto_next_entry(reader.Get());
            } while (rc_next == MZ_OK);

            if (rc_next != MZ_END_OF_LIST)
                throw PackageError(detail::rcMessage("goto_next_entry", rc_next));

            return package;
        }

        // Package from already-loaded entries, kept in the given order.
        static Package FromEntries(std::vector<Entry> entries) {
            for (const Entry &e: entries) {
                if (!detail::IsSafeZipEntryName(e.name))
                    throw PackageError("Refusing package with unsafe entry name: " + e.name);
            }
            Package package;
            package.entries_ = std::move(entries);
            return package;
        }

        // Write all entries, in their original order, to a new ZIP image.
        [[nodiscard]] std::vector<uint8_t> ToBytes() const {
            detail::MemStream stream;
            stream.OpenCreate();

            {
                detail::ZipWriter writer(stream);
                for (const Entry &e: entries_)
                    writer.Add(e);
                writer.Close();
            }

            return stream.CopyBuffer();
        }

        [[nodiscard]] bool Contains(const std::string_view name) const {
            return find(name) != nullptr;
        }

        // Payload of a file entry as UTF-8 text. Throws PackageError if absent.
        [[nodiscard]] std::string ReadText(const std::string_view name) const {
            const Entry *e = find(name);
            if (!e)
                throw PackageError("Package has no " + std::string(name) + ".");
            return std::string(e->data.begin(), e->data.end());
        }

        void ReplaceText(const std::string_view name, const std::string_view text) {
            Entry *e = find(name);
            if (!e)
                throw PackageError("Package has no " + std::string(name) + ".");
            e->data.assign(text.begin(), text.end());
        }

        [[nodiscard]] const std::vector<Entry> &entries() const noexcept { return entries_; }

    private:
        Package() = default;

        [[nodiscard]] const Entry *find(const std::string_view name) const {
            const auto it = std::find_if(entries_.begin(), entries_.end(), [name](const Entry &e) {
                return !e.isDir && e.name == name;
            });
            return it == entries_.end() ? nullptr : &*it;
        }

        [[nodiscard]] Entry *find(const std::string_view name) {
            return const_cast<Entry *>(std::as_const(*this).find(name));
        }

        std::vector<Entry> entries_;
    };

    struct BytesResult {
        bool success;
        std::string message;
        std::vector<uint8_t> outputBytes; // valid if success==true
    };

    // ------------------------- In-memory ZIP Bytes Core (minizip-ng) -------------------------
    // Cross-reference a .docx image -> new .docx image. Only word/document.xml
    // and word/footnotes.xml change; all other entries are written back as read.
    inline BytesResult ConvertBytes(const std::vector<uint8_t> &inputZipBytes,
                                    const ProcessOptions &options = {}) {
        try {
            Package package = Package::FromBytes(inputZipBytes);

            if (!package.Contains(DOCUMENT_PART))
                return {false, "❌ Not a Word document: word/document.xml is missing.", {}};

            if (!package.Contains(FOOTNOTES_PART))
                return {true, "✅ No footnotes (word/footnotes.xml); nothing to cross-reference.", inputZipBytes};

            const std::string document = package.ReadText(DOCUMENT_PART);
            const std::string footnotes = package.ReadText(FOOTNOTES_PART);

            const ProcessResult result = Process(document, footnotes, options);

            package.ReplaceText(DOCUMENT_PART, result.document);
            package.ReplaceText(FOOTNOTES_PART, result.footnotes);

            std::vector<uint8_t> outputBytes = package.ToBytes();

            const std::string msg = "✅ Linked " + std::to_string(result.stats.crossReferences) +
                                    " cross-reference(s) to " + std::to_string(result.stats.bookmarksInserted) +
                                    " footnote(s).";
            return {true, msg, std::move(outputBytes)};
        } catch (const Error &e) {
            return {false, std::string("❌ ") + ErrorKindName(e.kind()) + ": " + e.what(), {}};
        }
    }
} // namespace autocref::docx
