/// @file
/// ISO 11783-10 task data: field boundaries in, guidance patterns out.
#pragma once
#include "CoverageGeo.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pugi {
class xml_document;
} // pugi

namespace coverage {

struct FieldBoundary {
  std::string id;      // PFD A
  std::string name;    // PFD C
  geo::Ring boundary;  // exterior ring of the first boundary PLN
}; // FieldBoundary

class TaskData {
  std::unique_ptr<pugi::xml_document> doc;

  TaskData();

public:
  TaskData(TaskData&&) noexcept;
  TaskData& operator=(TaskData&&) noexcept;
  ~TaskData();

  /// @throw std::runtime_error on I/O, parse or structure errors.
  static TaskData Read(const std::filesystem::path& input);
  static TaskData Parse(std::string_view xml);

  /// Fields that carry a boundary polygon, in document order.
  std::vector<FieldBoundary> fields() const;

  /// Appends a curved guidance pattern (GGP/GPN) to field @p fieldId.
  /// @throw std::runtime_error if the field does not exist.
  void addGuidance(std::string_view fieldId, std::string_view name,
                   const geo::Path& path, Angle heading);

  /// @throw std::runtime_error if @p output cannot be written.
  void write(const std::filesystem::path& output) const;
  std::string str() const;
}; // TaskData

} // coverage
