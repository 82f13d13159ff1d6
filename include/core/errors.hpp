#ifndef IOTRANS_ERRORS_HPP
#define IOTRANS_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace iotrans {

/**
 * Base class for all errors raised by the conversion engine
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Caller-facing error raised before any disk I/O (bad request, inactive or empty dataset)
 */
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(message), constraints_{message} {}

    ValidationError(const std::string& message, std::vector<std::string> constraints)
        : Error(message), constraints_(std::move(constraints)) {}

    /**
     * Individual constraint violations that make up this error
     */
    const std::vector<std::string>& getConstraints() const { return constraints_; }

private:
    std::vector<std::string> constraints_;
};

/**
 * Precondition violation in the data itself (malformed geometry, unknown field type)
 */
class SchemaError : public Error {
public:
    explicit SchemaError(const std::string& message) : Error(message) {}
};

/**
 * Disk, directory or GDAL codec failure while producing an artifact
 */
class IoError : public Error {
public:
    explicit IoError(const std::string& message) : Error(message) {}
};

} // namespace iotrans

#endif // IOTRANS_ERRORS_HPP
