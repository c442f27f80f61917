#include "layout.hpp"
#include <fstream>
#include <system_error>

namespace specflow {

bool ensure_layout(const std::filesystem::path& root, std::string& error) {
    namespace fs = std::filesystem;
    for (const auto& dir :
         {specs_dir(root), locks_dir(root), pids_dir(root), logs_dir(root), store_dir(root)}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            error = "Failed to create " + dir.string() + ": " + ec.message();
            return false;
        }
    }
    fs::path ignore = state_dir(root) / ".gitignore";
    std::error_code ec;
    if (!fs::exists(ignore, ec)) {
        std::ofstream ofs(ignore);
        ofs << "*\n";
        if (!ofs) {
            error = "Failed to write " + ignore.string();
            return false;
        }
    }
    return true;
}

} // namespace specflow
