/**
 * @file errors.hpp
 * @brief Exception types thrown by libtocsplit.
 *
 * Every error raised by the library derives from TocsplitError, which
 * is itself a std::runtime_error, so callers can catch at whichever
 * granularity they need.
 */

#ifndef TOCSPLIT_ERRORS_HPP
#define TOCSPLIT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace tocsplit {

/**
 * @brief Base class of all tocsplit errors.
 */
class TocsplitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The source byte stream is not a parseable PDF document.
 */
class CorruptDocument final : public TocsplitError {
public:
    using TocsplitError::TocsplitError;
};

/**
 * @brief The source path does not exist or is not a regular file.
 */
class DocumentNotFound final : public TocsplitError {
public:
    using TocsplitError::TocsplitError;
};

/**
 * @brief An operation was attempted on a DocumentHandle after close().
 */
class DocumentClosed final : public TocsplitError {
public:
    DocumentClosed() : TocsplitError("document handle is closed") {}
};

/**
 * @brief A page range lies outside [1, page_count] or is reversed.
 */
class InvalidRange final : public TocsplitError {
public:
    using TocsplitError::TocsplitError;
};

/**
 * @brief A TOC with no top-level chapters was handed to the resolver.
 */
class EmptyTree final : public TocsplitError {
public:
    EmptyTree() : TocsplitError("table of contents has no chapters") {}
};

/**
 * @brief A TOC document could not be decoded from its wire shape.
 */
class TocFormatError final : public TocsplitError {
public:
    using TocsplitError::TocsplitError;
};

/**
 * @brief Writing the output file of one TOC node failed.
 *
 * Carries the node's number and title so the job error names the
 * section that broke the split.
 */
class SplitFailure final : public TocsplitError {
public:
    SplitFailure(std::string number, std::string title, const std::string& cause)
        : TocsplitError("failed to split section " + number + " '" + title + "': " + cause),
          number_(std::move(number)),
          title_(std::move(title)),
          cause_(cause) {}

    [[nodiscard]] const std::string& number() const noexcept { return number_; }
    [[nodiscard]] const std::string& title() const noexcept { return title_; }
    [[nodiscard]] const std::string& cause() const noexcept { return cause_; }

private:
    std::string number_;
    std::string title_;
    std::string cause_;
};

/**
 * @brief Packaging a finished output tree into an archive failed.
 */
class ArchiveFailure final : public TocsplitError {
public:
    using TocsplitError::TocsplitError;
};

/**
 * @brief No job with the requested id exists.
 */
class JobNotFound final : public TocsplitError {
public:
    explicit JobNotFound(const std::string& id) : TocsplitError("job not found: " + id) {}
};

/**
 * @brief The job's output was requested before it completed.
 */
class JobNotReady final : public TocsplitError {
public:
    JobNotReady(const std::string& id, const std::string& status)
        : TocsplitError("job " + id + " is not completed (status: " + status + ")") {}
};

} // namespace tocsplit

#endif // TOCSPLIT_ERRORS_HPP
