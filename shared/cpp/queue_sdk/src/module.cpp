#include "../include/module.hpp"
#include "../include/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace nlpq {

namespace {
QueueError unsupported(const std::string& module, const std::string& format) {
    return QueueError(ErrorKind::BadRequest, "Module " + module + " cannot convert to format '" + format + "'");
}

QueueError not_a_count_table(const std::string& line) {
    return QueueError(ErrorKind::BadRequest, "Not a wordcount result near '" + line + "'");
}

class EchoModule final : public Module {
public:
    std::string name() const override { return "echo"; }
    std::string process(const std::string& text) const override { return text; }
    std::string convert(const std::string& result, const std::string& format) const override {
        if (format == "json") return json({{"text", result}}).dump();
        return Module::convert(result, format);
    }
};

class UpperModule final : public Module {
public:
    std::string name() const override { return "upper"; }
    std::string process(const std::string& text) const override {
        std::string out = text;
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }
    std::string convert(const std::string& result, const std::string& format) const override {
        if (format == "json") return json({{"text", result}}).dump();
        return Module::convert(result, format);
    }
};

// CSV with a "word,count" header, one row per distinct lower-cased word.
class WordCountModule final : public Module {
public:
    std::string name() const override { return "wordcount"; }

    std::string process(const std::string& text) const override {
        std::map<std::string, std::size_t> counts;
        std::string word;
        auto flush = [&] {
            if (!word.empty()) ++counts[word];
            word.clear();
        };
        for (unsigned char c : text) {
            if (std::isalnum(c)) word.push_back(static_cast<char>(std::tolower(c)));
            else flush();
        }
        flush();
        std::ostringstream out;
        out << "word,count\n";
        for (const auto& kv : counts) out << kv.first << ',' << kv.second << '\n';
        return out.str();
    }

    std::string convert(const std::string& result, const std::string& format) const override {
        if (format == "csv") return result;
        if (format != "json") return Module::convert(result, format);
        json out = json::object();
        std::istringstream in(result);
        std::string line;
        std::getline(in, line); // header
        if (line != "word,count") throw not_a_count_table(line);
        while (std::getline(in, line)) {
            auto comma = line.rfind(',');
            if (comma == std::string::npos || comma + 1 == line.size()) throw not_a_count_table(line);
            const char* digits = line.c_str() + comma + 1;
            char* end = nullptr;
            unsigned long count = std::strtoul(digits, &end, 10);
            if (*end != '\0' || !std::isdigit(static_cast<unsigned char>(*digits))) throw not_a_count_table(line);
            out[line.substr(0, comma)] = count;
        }
        return out.dump();
    }
};
}

std::string Module::convert(const std::string& /*result*/, const std::string& format) const {
    throw unsupported(name(), format);
}

void ModuleRegistry::add(std::unique_ptr<Module> module) {
    std::string key = module->name();
    modules_[key] = std::move(module);
}

const Module* ModuleRegistry::find(const std::string& name) const {
    auto it = modules_.find(name);
    return it == modules_.end() ? nullptr : it->second.get();
}

const Module& ModuleRegistry::get(const std::string& name) const {
    const Module* m = find(name);
    if (!m) throw QueueError(ErrorKind::UnknownModule, "Unknown module: " + name);
    return *m;
}

std::vector<std::string> ModuleRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(modules_.size());
    for (const auto& kv : modules_) out.push_back(kv.first);
    return out;
}

ModuleRegistry builtin_modules() {
    ModuleRegistry registry;
    registry.add(std::make_unique<EchoModule>());
    registry.add(std::make_unique<UpperModule>());
    registry.add(std::make_unique<WordCountModule>());
    return registry;
}

} // namespace nlpq
