#include "sweguard/task/task.hpp"

#include <stdexcept>

namespace sweguard::task {

double version_number(const std::string &version) {
  try {
    std::size_t consumed = 0;
    const double value = std::stod(version, &consumed);
    return consumed == version.size() ? value : 0.0;
  } catch (const std::exception &) {
    return 0.0;
  }
}

std::string resolve_runtime_version(const std::string &repo, const std::string &version) {
  const double ver = version_number(version);

  if (repo == "django/django") {
    if (ver < 3.0) {
      return "3.5";
    }
    if (ver < 4.0) {
      return "3.6";
    }
    if (ver < 4.1) {
      return "3.8";
    }
    return ver < 5.0 ? "3.9" : "3.11";
  }
  if (repo == "astropy/astropy") {
    if (ver < 3.0) {
      return "3.6";
    }
    return ver < 5.3 ? "3.9" : "3.10";
  }
  if (repo == "matplotlib/matplotlib") {
    if (ver < 3.0) {
      return "3.5";
    }
    if (ver < 3.1) {
      return "3.7";
    }
    return ver < 3.5 ? "3.8" : "3.11";
  }
  if (repo == "scikit-learn/scikit-learn") {
    return ver < 1.0 ? "3.6" : "3.9";
  }
  if (repo == "pallets/flask") {
    if (ver < 2.1) {
      return "3.9";
    }
    return ver < 2.2 ? "3.10" : "3.11";
  }
  if (repo == "pydata/xarray") {
    return "3.10";
  }
  return "3.9";
}

} // namespace sweguard::task
