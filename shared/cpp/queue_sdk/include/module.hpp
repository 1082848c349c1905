#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace nlpq {

// A named text-processing capability.
class Module {
public:
    virtual ~Module() = default;

    virtual std::string name() const = 0;
    virtual std::string process(const std::string& text) const = 0;
    // Throws QueueError(BadRequest) for unsupported formats.
    virtual std::string convert(const std::string& result, const std::string& format) const;
};

class ModuleRegistry {
public:
    ModuleRegistry() = default;
    ModuleRegistry(const ModuleRegistry&) = delete;
    ModuleRegistry& operator=(const ModuleRegistry&) = delete;
    ModuleRegistry(ModuleRegistry&&) = default;
    ModuleRegistry& operator=(ModuleRegistry&&) = default;

    void add(std::unique_ptr<Module> module);
    const Module* find(const std::string& name) const;
    // Throws QueueError(UnknownModule).
    const Module& get(const std::string& name) const;
    std::vector<std::string> names() const;

private:
    std::map<std::string, std::unique_ptr<Module>> modules_;
};

// echo, upper and wordcount.
ModuleRegistry builtin_modules();

} // namespace nlpq
