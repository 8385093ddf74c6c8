/**
 * @file PortMapping.cpp
 * @brief PortMapping container and its JSON persistence.
 */

#include "src/binder/inc/PortMapping.hpp"
#include "src/helpers/inc/Files.hpp"

#include <algorithm>
#include <exception>

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace opssetup {

namespace binder {

namespace {

/// Escape a string for a JSON string literal.
std::string jsonQuote(std::string_view in) {
  std::string out;
  out.reserve(in.size() + 2);
  out += '"';
  for (const char C : in) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(C)));
      } else {
        out += C;
      }
      break;
    }
  }
  out += '"';
  return out;
}

} // namespace

/* ----------------------------- PortMapping Methods ----------------------------- */

bool PortMapping::insert(std::string label, std::string port) {
  if (contains(label)) {
    return false;
  }
  entries_.emplace_back(std::move(label), std::move(port));
  return true;
}

const std::string* PortMapping::find(std::string_view label) const noexcept {
  for (const Entry& e : entries_) {
    if (e.first == label) {
      return &e.second;
    }
  }
  return nullptr;
}

bool PortMapping::contains(std::string_view label) const noexcept { return find(label) != nullptr; }

std::size_t PortMapping::size() const noexcept { return entries_.size(); }

bool PortMapping::empty() const noexcept { return entries_.empty(); }

const std::vector<PortMapping::Entry>& PortMapping::entries() const noexcept { return entries_; }

bool PortMapping::sameBindings(const PortMapping& other) const noexcept {
  if (size() != other.size()) {
    return false;
  }
  return std::all_of(entries_.begin(), entries_.end(), [&other](const Entry& e) {
    const std::string* port = other.find(e.first);
    return port != nullptr && *port == e.second;
  });
}

std::string PortMapping::toJson() const {
  std::string out = "{";
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += fmt::format("{}: {}", jsonQuote(entries_[i].first), jsonQuote(entries_[i].second));
  }
  out += '}';
  return out;
}

std::string PortMapping::toString() const {
  if (entries_.empty()) {
    return "(empty)";
  }
  std::string out;
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += fmt::format("{}->{}", entries_[i].first, entries_[i].second);
  }
  return out;
}

/* ----------------------------- Persistence ----------------------------- */

bool PortMappingLoad::ok() const noexcept { return status == SetupStatus::OK; }

PortMappingLoad parsePortMapping(std::string_view document) noexcept {
  PortMappingLoad load{};
  try {
    const YAML::Node ROOT = YAML::Load(std::string(document));
    if (!ROOT.IsMap()) {
      load.status = SetupStatus::PARSE_ERROR;
      load.message = "mapping document is not an object";
      return load;
    }

    for (const auto& KV : ROOT) {
      if (!KV.first.IsScalar() || !KV.second.IsScalar()) {
        load.status = SetupStatus::PARSE_ERROR;
        load.message = "mapping entries must be strings";
        return load;
      }
      if (!load.mapping.insert(KV.first.Scalar(), KV.second.Scalar())) {
        load.status = SetupStatus::PARSE_ERROR;
        load.message = fmt::format("duplicate label '{}'", KV.first.Scalar());
        return load;
      }
    }
  } catch (const std::exception& e) {
    load = PortMappingLoad{};
    load.status = SetupStatus::PARSE_ERROR;
    load.message = e.what();
  }
  return load;
}

PortMappingLoad loadPortMapping(const std::string& path) noexcept {
  try {
    std::string document;
    if (!helpers::files::readFileToString(path, document)) {
      PortMappingLoad load{};
      load.status = SetupStatus::IO_ERROR;
      load.message = fmt::format("cannot read {}", path);
      return load;
    }
    return parsePortMapping(document);
  } catch (const std::exception& e) {
    PortMappingLoad load{};
    load.status = SetupStatus::IO_ERROR;
    load.message = e.what();
    return load;
  }
}

SetupStatus savePortMapping(const std::string& path, const PortMapping& mapping) {
  return helpers::files::writeFile(path, mapping.toJson()) ? SetupStatus::OK
                                                           : SetupStatus::IO_ERROR;
}

} // namespace binder

} // namespace opssetup
