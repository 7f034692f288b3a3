#include "stash/image/png.hpp"

#include <csetjmp>
#include <cstring>
#include <format>
#include <stdexcept>

#include "stash/auxiliary/err_str.hpp"


namespace {

    struct PngMemStream {
        const uint8_t* data = nullptr;
        size_t size = 0;
        size_t pos = 0;
    };


    void png_mem_read(png_structp png_ptr, png_bytep out, png_size_t size) {
        auto* io = static_cast<::PngMemStream*>(png_get_io_ptr(png_ptr));

        if (!io || !io->data || size > io->size - io->pos) {
            png_error(png_ptr, "Read past end of buffer");
            return;
        }

        std::memcpy(out, io->data + io->pos, size);
        io->pos += size;
    }

    void png_throw_error(png_structp png_ptr, png_const_charp msg) {
        throw std::runtime_error(msg ? msg : "libpng error");
    }

    void png_collect_warning(png_structp png_ptr, png_const_charp msg) {
        auto* warnings = static_cast<std::vector<std::string>*>(
            png_get_error_ptr(png_ptr)
        );
        if (warnings)
            warnings->emplace_back(msg ? msg : "libpng warning");
    }


    class PngReader {

    public:
        PngReader() = default;

        ~PngReader() { this->destroy(); }

        PngReader(const PngReader&) = delete;
        PngReader& operator=(const PngReader&) = delete;

        stash::ErrStr open(const uint8_t* data, size_t size) {
            this->destroy();

            // ---- Verify signature ----

            if (!data || size < 8)
                return std::unexpected("Short read (signature)");

            if (png_sig_cmp(data, 0, 8))
                return std::unexpected("Not a PNG file");

            // ---- Init libpng ----

            png_ptr_ = png_create_read_struct(
                PNG_LIBPNG_VER_STRING,
                &warnings_,
                png_throw_error,
                png_collect_warning
            );
            if (!png_ptr_)
                return std::unexpected("png_create_read_struct failed");

            info_ptr_ = png_create_info_struct(png_ptr_);
            if (!info_ptr_)
                return std::unexpected("png_create_info_struct failed");

            // Hook the buffer into libpng, past the signature
            io_ = { data, size, 8 };
            png_set_read_fn(png_ptr_, &io_, png_mem_read);
            png_set_sig_bytes(png_ptr_, 8);

            return {};
        }

        stash::ErrStr parse_info() {
            if (setjmp(png_jmpbuf(png_ptr_))) {
                return std::unexpected("libpng error while reading info");
            }

            try {
                png_read_info(png_ptr_, info_ptr_);
            } catch (const std::exception& e) {
                return std::unexpected(
                    std::format("Failed to parse PNG info: {}", e.what())
                );
            }

            return {};
        }

        stash::ErrStr get_metadata(stash::PngMeta& meta) {
            try {
                meta.width = png_get_image_width(png_ptr_, info_ptr_);
                meta.height = png_get_image_height(png_ptr_, info_ptr_);
                meta.bit_depth = png_get_bit_depth(png_ptr_, info_ptr_);
                meta.color_type = png_get_color_type(png_ptr_, info_ptr_);

                png_textp text_ptr = nullptr;
                int num_text = 0;
                const auto result = png_get_text(
                    png_ptr_, info_ptr_, &text_ptr, &num_text
                );

                if (result > 0) {
                    meta.text.reserve((size_t)num_text);

                    for (int i = 0; i < num_text; ++i) {
                        const char* key = text_ptr[i].key ? text_ptr[i].key
                                                          : "";
                        const char* val = text_ptr[i].text ? text_ptr[i].text
                                                           : "";

                        meta.text.push_back(
                            { std::string(key), std::string(val) }
                        );
                    }
                }
            } catch (const std::exception& e) {
                return std::unexpected(
                    std::format("Failed to get PNG metadata: {}", e.what())
                );
            }

            meta.warnings = std::move(warnings_);
            warnings_.clear();
            return {};
        }

        void destroy() {
            if (png_ptr_ || info_ptr_) {
                png_destroy_read_struct(&png_ptr_, &info_ptr_, nullptr);
                png_ptr_ = nullptr;
                info_ptr_ = nullptr;
            }
            io_ = {};
        }

    private:
        PngMemStream io_;
        std::vector<std::string> warnings_;
        png_structp png_ptr_ = nullptr;
        png_infop info_ptr_ = nullptr;
    };

}  // namespace


namespace stash {

    std::expected<PngMeta, std::string> read_png_meta(
        const uint8_t* data, size_t size
    ) {
        ::PngReader reader;

        const auto exp_open = reader.open(data, size);
        if (!exp_open)
            return std::unexpected(exp_open.error());

        // ---- Parse header & metadata ----

        const auto exp_parse_info = reader.parse_info();
        if (!exp_parse_info)
            return std::unexpected(exp_parse_info.error());

        PngMeta meta;
        const auto exp_metadata = reader.get_metadata(meta);
        if (!exp_metadata)
            return std::unexpected(exp_metadata.error());

        return meta;
    }

    const char* color_type_str(const int color_type) {
        switch (color_type) {
            case PNG_COLOR_TYPE_GRAY:
                return "grayscale";
            case PNG_COLOR_TYPE_RGB:
                return "rgb";
            case PNG_COLOR_TYPE_PALETTE:
                return "palette";
            case PNG_COLOR_TYPE_GRAY_ALPHA:
                return "grayscale+alpha";
            case PNG_COLOR_TYPE_RGB_ALPHA:
                return "rgba";
            default:
                return "unknown";
        }
    }

}  // namespace stash
