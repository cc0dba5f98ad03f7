#include "chunkvault/errors.hpp"

#include <utility>

namespace chunkvault {

namespace {

std::string IntegrityMessage(std::size_t index, const std::string& expected, const std::string& actual) {
    return "Chunk " + std::to_string(index) + " hash mismatch: expected " + expected + ", got " + actual;
}

}  // namespace

IntegrityError::IntegrityError(std::size_t index, std::string expected, std::string actual)
    : Error(IntegrityMessage(index, expected, actual)),
      index_(index),
      expected_(std::move(expected)),
      actual_(std::move(actual)) {}

}  // namespace chunkvault
