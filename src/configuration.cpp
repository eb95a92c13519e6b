#include <ratchet/configuration.hpp>

#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>
#include <vector>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/sync/sharable_lock.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>

namespace fs = std::filesystem;
using boost::property_tree::ptree;

namespace ratchet {

namespace {

fs::path const & config_dir_user()
{
    static struct ConfigDirUser
    {
        ConfigDirUser()
        {
            char const* xdg_config_home = getenv("XDG_CONFIG_HOME");
            if (xdg_config_home != nullptr) {
                path = fs::path(xdg_config_home);
            }
            if (path.empty()) {
                char const* home = getenv("HOME");
                if (home != nullptr) {
                    path = fs::path(home) / ".config";
                }
            }
            if (!path.empty()) {
                path /= "ratchet";
            }
        }

        fs::path path;
    } config_dir_user;

    if (config_dir_user.path.empty()) {
        throw std::runtime_error("Neither XDG_CONFIG_HOME nor HOME is set.");
    }
    return config_dir_user.path;
};

fs::path joined(fs::path path, std::span<std::string_view const> subpaths) {
    for (const auto& subpath : subpaths) {
        path /= subpath;
    }
    return path;
}

std::string_view path_helper(fs::path& path, std::span<std::string_view const> subpaths, bool is_dir) {
    path = joined(std::move(path), subpaths);
    if (is_dir) {
        fs::create_directories(path);
        path /= "";
    } else {
        fs::create_directories(path.parent_path());
    }
    return path.native();
}

/*
 * Walks the children of one section across every file, project file first.
 * A key seen in an earlier file hides the same key in later ones. The
 * projection picks what to yield for a child, or skips it.
 */
template <typename Out>
class ChildWalk
{
public:
    using signature = Out();
    using Projection = std::function<std::optional<Out>(ptree::value_type const &)>;

    struct Walking { size_t layer; ptree::const_iterator it; };
    using position = Position<Walking>;
    using yield = Yield<Out, position>;

    ChildWalk(std::vector<ptree const*> sections, Projection project)
    : sections_(std::move(sections))
    , project_(std::move(project))
    { }

    Step<Out> operator()(Start, yield & y)
    {
        if (sections_.empty()) {
            return y.finish();
        }
        return next(0, sections_[0]->begin(), y);
    }

    Step<Out> operator()(Walking & at, yield & y)
    {
        return next(at.layer, std::next(at.it), y);
    }

private:
    Step<Out> next(size_t layer, ptree::const_iterator it, yield & y)
    {
        while (true) {
            for (; it != sections_[layer]->end(); ++ it) {
                if (!seen_.insert(it->first).second) {
                    continue;
                }
                if (auto out = project_(*it)) {
                    return y.yield(std::move(*out), Walking{layer, it});
                }
            }
            if (++ layer == sections_.size()) {
                return y.finish();
            }
            it = sections_[layer]->begin();
        }
    }

    std::vector<ptree const*> sections_;
    Projection project_;
    std::unordered_set<std::string> seen_;
};

class ConfigurationImpl {
public:
    // Only reads: neither directory is created here.
    ConfigurationImpl(std::span<std::string_view const> subpath, bool user_wide)
    {
        if (!user_wide) {
            try {
                load(joined(fs::path(Configuration::path_local()), subpath));
            } catch (std::invalid_argument const&) {
                // no project directory, only the per-user defaults apply
            }
        }
        load(joined(config_dir_user(), subpath));
    }

    std::string_view operator[](std::span<std::string_view const> locator) const {
        for (auto & [path, pt] : layers_) {
            auto * value = find(pt, locator, false);
            if (value != nullptr && !value->data().empty()) {
                return value->data();
            }
        }
        return {};
    }

    Generator<std::string()> sections(std::span<std::string_view const> locator) const {
        if (locator.size() == 1) {
            std::string prefix = std::string(locator[0]) + " \"";
            return make_generator<ChildWalk<std::string>>(roots(), [prefix](ptree::value_type const & val) -> std::optional<std::string> {
                auto & key = val.first;
                if (key.size() > prefix.size() && key.starts_with(prefix) && key.back() == '"') {
                    std::istringstream iss(key.substr(prefix.size() - 1));
                    std::string subsection;
                    iss >> std::quoted(subsection);
                    return subsection;
                }
                return std::nullopt;
            });
        }
        return make_generator<ChildWalk<std::string>>(below(locator), [](ptree::value_type const & val) -> std::optional<std::string> {
            if (val.second.empty()) {
                return std::nullopt;
            }
            return val.first;
        });
    }

    Generator<StringPair()> values(std::span<std::string_view const> locator) const {
        return make_generator<ChildWalk<StringPair>>(below(locator), [](ptree::value_type const & val) -> std::optional<StringPair> {
            if (val.second.data().empty()) {
                return std::nullopt;
            }
            return StringPair{val.first, val.second.data()};
        });
    }

private:
    void load(fs::path const & path) {
        if (!fs::exists(path)) {
            return;
        }
        boost::interprocess::file_lock lock(path.c_str());
        boost::interprocess::sharable_lock<boost::interprocess::file_lock> guard(lock, boost::interprocess::try_to_lock);
        if (!guard.owns()) {
            std::cerr << "Waiting for another process to finish with " << path << " ..." << std::endl;
            guard.lock();
        }
        layers_.emplace_back(path.string(), ptree());
        boost::property_tree::ini_parser::read_ini(layers_.back().first, layers_.back().second);
    }

    std::vector<ptree const*> roots() const {
        std::vector<ptree const*> result;
        for (auto & [path, pt] : layers_) {
            result.push_back(&pt);
        }
        return result;
    }

    std::vector<ptree const*> below(std::span<std::string_view const> locator) const {
        std::vector<ptree const*> result;
        for (auto & [path, pt] : layers_) {
            auto * section = find(pt, locator, true);
            if (section != nullptr) {
                result.push_back(section);
            }
        }
        return result;
    }

    static ptree const * find(ptree const & pt, std::span<std::string_view const> locator, bool is_section) {
        if (locator.empty()) {
            return &pt;
        }
        // ptree uses std::string for find()
        std::string fragment;
        if (locator.size() >= (is_section ? 2 : 3)) {
            std::stringstream ss;
            ss << locator[0];
            ss << ' ' << std::quoted(locator[1]);
            fragment = ss.str();
            locator = locator.subspan(2);
        } else {
            fragment = locator[0];
            locator = locator.subspan(1);
        }
        auto * key_pt = &pt;
        while (true) {
            auto pt_it = key_pt->find(fragment);
            if (pt_it == key_pt->not_found()) {
                return nullptr;
            }
            key_pt = &pt_it->second;
            if (locator.empty()) {
                return key_pt;
            }
            fragment = locator[0];
            locator = locator.subspan(1);
        }
    }

    std::vector<std::pair<std::string, ptree>> layers_;
};

} // namespace

bool Configuration::init() {
    try {
        path_local();
    } catch (std::invalid_argument const& e) {
        fs::create_directory(".ratchet");
        return true;
    }
    return false;
}

Configuration::Configuration(std::span<std::string_view const> subpath, bool user_wide)
    : impl_(reinterpret_cast<void*>(new ConfigurationImpl(subpath, user_wide))) {}

Configuration::~Configuration() {
    delete reinterpret_cast<ConfigurationImpl*>(impl_);
}

std::string_view Configuration::operator[](std::span<std::string_view const> locator) const {
    return (*reinterpret_cast<ConfigurationImpl const*>(impl_))[locator];
}

Generator<std::string()> Configuration::sections(std::span<std::string_view const> locator) const {
    return reinterpret_cast<ConfigurationImpl const*>(impl_)->sections(locator);
}

Generator<StringPair()> Configuration::values(std::span<std::string_view const> locator) const {
    return reinterpret_cast<ConfigurationImpl const*>(impl_)->values(locator);
}

std::string_view Configuration::path_local(std::span<std::string_view const> subpaths, bool is_dir) {
    static fs::path config_dir_local;

    {
        static std::mutex mtx;
        std::lock_guard<std::mutex> lock(mtx);

        if (config_dir_local.empty()) {
            fs::path ratchet_dir;
            for (
                fs::path path = fs::current_path(), parent_path = path.parent_path();
                !path.empty() && path != parent_path;
                path = parent_path, parent_path = path.parent_path()
            ) {
                ratchet_dir = path / ".ratchet";
                if (fs::exists(ratchet_dir)) {
                    config_dir_local = ratchet_dir;
                    break;
                }
            }
            if (config_dir_local.empty()) {
                throw std::invalid_argument("Could not find .ratchet directory for project. Create one.");
            }
        }
    }

    static thread_local fs::path path;
    path = config_dir_local;
    return path_helper(path, subpaths, is_dir);
}

std::string_view Configuration::path_user(std::span<std::string_view const> subpaths, bool is_dir) {
    static thread_local fs::path path;
    path = config_dir_user();
    return path_helper(path, subpaths, is_dir);
}

} // namespace ratchet
