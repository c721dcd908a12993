#pragma once

#include <stdexcept>
#include <string>

/**
 * @file extraction_errors.hpp
 * @brief Exception families raised by the codec, store and merge layers.
 *
 * Every fatal failure derives from ExtractionError and carries a coarse
 * ErrorKind that the orchestration layer reports to users, plus a family
 * specific sub-kind for callers and tests that need finer detail.
 */

namespace lxt
{

enum class ErrorKind
{
    Codec,
    Store,
    Merge,
    Conversion,
    Timeout,
};

/**
 * @brief Returns the lowercase name of an error kind.
 */
const char* to_string(ErrorKind kind);

class ExtractionError : public std::runtime_error
{
public:
    ExtractionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class CodecError : public ExtractionError
{
public:
    enum class Kind
    {
        TableOverflow,
        Truncated,
        InvalidCode,
        RecordOverflow,
        InvalidParameters,
    };

    CodecError(Kind kind, const std::string& message)
        : ExtractionError(ErrorKind::Codec, message), codec_kind_(kind) {}

    Kind codec_kind() const { return codec_kind_; }

private:
    Kind codec_kind_;
};

class StoreError : public ExtractionError
{
public:
    enum class Kind
    {
        Open,
        Read,
        OutOfRange,
        NotPositioned,
        Closed,
    };

    StoreError(Kind kind, const std::string& message)
        : ExtractionError(ErrorKind::Store, message), store_kind_(kind) {}

    Kind store_kind() const { return store_kind_; }

private:
    Kind store_kind_;
};

class MergeError : public ExtractionError
{
public:
    enum class Kind
    {
        InvalidRequest,
        InvalidSource,
        InvalidReplacement,
    };

    MergeError(Kind kind, const std::string& message)
        : ExtractionError(ErrorKind::Merge, message), merge_kind_(kind) {}

    Kind merge_kind() const { return merge_kind_; }

private:
    Kind merge_kind_;
};

class ConversionError : public ExtractionError
{
public:
    enum class Kind
    {
        InvalidValue,
        UnsupportedCombination,
    };

    ConversionError(Kind kind, const std::string& message)
        : ExtractionError(ErrorKind::Conversion, message), conversion_kind_(kind) {}

    Kind conversion_kind() const { return conversion_kind_; }

private:
    Kind conversion_kind_;
};

class TimeoutError : public ExtractionError
{
public:
    explicit TimeoutError(const std::string& message)
        : ExtractionError(ErrorKind::Timeout, message) {}
};

} // namespace lxt
