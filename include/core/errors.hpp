#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

namespace larcc {

/**
 * @brief Base class for all errors raised by the reaching task logic
 */
class LarccError : public std::runtime_error {
public:
    explicit LarccError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A pose argument did not contain exactly 7 scalars
 */
class InvalidPoseShape : public LarccError {
public:
    explicit InvalidPoseShape(size_t got)
        : LarccError("Invalid pose shape: expected 7 values, got " + std::to_string(got)),
          size_(got) {}

    size_t size() const { return size_; }

private:
    size_t size_;
};

/**
 * @brief An action argument did not contain one value per arm joint
 */
class InvalidActionShape : public LarccError {
public:
    explicit InvalidActionShape(size_t got)
        : LarccError("Invalid action shape: expected 6 values, got " + std::to_string(got)) {}
};

/**
 * @brief Goal rejection sampling exhausted its attempt budget
 */
class SamplingTimeout : public LarccError {
public:
    explicit SamplingTimeout(int attempts)
        : LarccError("Goal sampling found no valid orientation after " +
                     std::to_string(attempts) + " attempts"),
          attempts_(attempts) {}

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

/**
 * @brief Random-start reset exhausted its attempt budget
 */
class ResetTimeout : public LarccError {
public:
    explicit ResetTimeout(int attempts)
        : LarccError("Episode reset found no valid joint configuration after " +
                     std::to_string(attempts) + " attempts"),
          attempts_(attempts) {}

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

/**
 * @brief Configuration value outside its permitted range or of the wrong type
 */
class ConfigurationInvalid : public LarccError {
public:
    explicit ConfigurationInvalid(const std::string& what)
        : LarccError("Invalid configuration: " + what) {}
};

/**
 * @brief Physics backend failure (model load, unknown body or joint name)
 */
class PhysicsError : public LarccError {
public:
    explicit PhysicsError(const std::string& what) : LarccError(what) {}
};

} // namespace larcc
