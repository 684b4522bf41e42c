#pragma once

#include <stdexcept>
#include <string>

class NotFoundError : public std::runtime_error {
  public:
    explicit NotFoundError(const std::string &name)
        : std::runtime_error("Habit '" + name + "' not found"), m_Name(name) {}
    const std::string &Name() const { return m_Name; }

  private:
    std::string m_Name;
};

class DuplicateNameError : public std::runtime_error {
  public:
    explicit DuplicateNameError(const std::string &name)
        : std::runtime_error("Habit '" + name + "' already exists"), m_Name(name) {}
    const std::string &Name() const { return m_Name; }

  private:
    std::string m_Name;
};

class InvalidPeriodicityError : public std::runtime_error {
  public:
    explicit InvalidPeriodicityError(const std::string &value)
        : std::runtime_error("periodicity must be 'daily' or 'weekly', got '" + value + "'") {}
};

// Raised by the SQLite store when open/prepare/step fails.
class StorageError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};
