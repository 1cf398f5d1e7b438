#ifndef TOCSPLIT_MIME_DETECTOR_HPP
#define TOCSPLIT_MIME_DETECTOR_HPP

#include <cstddef>
#include <filesystem>
#include <string>

namespace tocsplit {

    /**
     * @brief Content-based file type detection backed by libmagic.
     *
     * Both functions return an empty string when libmagic cannot be
     * initialised or cannot classify the input; callers treat that as
     * "unknown" rather than as an error.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file on disk.
         * @return A MIME type such as "application/pdf", or "" if unknown.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Detect the MIME type of an in-memory buffer.
         */
        static std::string detect(const unsigned char* data, std::size_t size);

        /**
         * @brief True if mime is known and is not a PDF type.
         *
         * Unknown ("") and generic binary results are not considered
         * mismatches, so qpdf still gets the final word on those inputs.
         */
        static bool is_definitely_not_pdf(const std::string& mime);
    };

} // namespace tocsplit

#endif // TOCSPLIT_MIME_DETECTOR_HPP
