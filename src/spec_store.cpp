#include "spec_store.hpp"
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <fstream>
#include <sstream>
#include <system_error>

namespace specflow {

bool SpecStore::exists(const std::string& id) const {
    std::error_code ec;
    return fs::is_regular_file(path_for(id), ec);
}

std::vector<std::string> SpecStore::list_ids() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec))
        return ids;
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (entry.path().extension() != ".md")
            continue;
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec))
            continue;
        ids.push_back(entry.path().stem().string());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::optional<Spec> SpecStore::load(const std::string& id, std::string* error) const {
    std::ifstream ifs(path_for(id), std::ios::binary);
    if (!ifs) {
        if (error)
            *error = "Spec not found: " + id;
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return parse_spec(id, ss.str(), error);
}

std::vector<Spec> SpecStore::load_all(std::vector<std::string>* errors) const {
    std::vector<Spec> specs;
    for (const auto& id : list_ids()) {
        std::string err;
        auto spec = load(id, &err);
        if (spec)
            specs.push_back(std::move(*spec));
        else if (errors)
            errors->push_back(err);
    }
    return specs;
}

bool SpecStore::save(const Spec& spec, std::string& error) const {
    static std::atomic<unsigned long> counter{0};
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        error = "Failed to create " + dir_.string() + ": " + ec.message();
        return false;
    }
    fs::path target = path_for(spec.id);
    fs::path tmp = target;
    tmp += ".tmp." + std::to_string(getpid()) + "." + std::to_string(counter++);
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            error = "Failed to open " + tmp.string();
            return false;
        }
        ofs << serialize_spec(spec);
        ofs.flush();
        if (!ofs) {
            error = "Failed to write " + tmp.string();
            ofs.close();
            fs::remove(tmp, ec);
            return false;
        }
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        error = "Failed to replace " + target.string() + ": " + ec.message();
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return false;
    }
    return true;
}

std::optional<std::string> SpecStore::resolve_id(const std::string& partial,
                                                 std::string* error) const {
    if (partial.empty()) {
        if (error)
            *error = "Empty spec id";
        return std::nullopt;
    }
    if (exists(partial))
        return partial;
    const auto ids = list_ids();
    auto collect = [&](auto&& match) {
        std::vector<std::string> out;
        for (const auto& id : ids) {
            if (match(id))
                out.push_back(id);
        }
        return out;
    };
    // Tiers: prefix, then suffix (the random tail of a dated id), then anywhere.
    std::vector<std::string> matches =
        collect([&](const std::string& id) { return id.rfind(partial, 0) == 0; });
    if (matches.empty()) {
        matches = collect([&](const std::string& id) {
            return id.size() > partial.size() &&
                   id.compare(id.size() - partial.size(), partial.size(), partial) == 0;
        });
    }
    if (matches.empty()) {
        matches = collect(
            [&](const std::string& id) { return id.find(partial) != std::string::npos; });
    }
    if (matches.size() == 1)
        return matches.front();
    if (error) {
        if (matches.empty()) {
            *error = "Spec not found: " + partial;
        } else {
            *error = "Ambiguous spec id '" + partial + "' matches:";
            for (const auto& m : matches)
                *error += " " + m;
        }
    }
    return std::nullopt;
}

} // namespace specflow
