#pragma once

#include <filesystem>
#include <string>
#include <vector>

class ConfigStore;

class ConfigValidator {
public:
  virtual ~ConfigValidator() = default;

  // False (with error set) rejects the file. Warnings do not.
  virtual bool validate(const std::filesystem::path& path,
                        const ConfigStore& config,
                        std::vector<std::string>& warnings,
                        std::string& error) const = 0;
};

// Checks that the file is a JSON object and that every key the store knows has
// a value of the declared type. Unknown keys only produce warnings.
class JsonConfigValidator : public ConfigValidator {
public:
  bool validate(const std::filesystem::path& path,
                const ConfigStore& config,
                std::vector<std::string>& warnings,
                std::string& error) const override;
};
