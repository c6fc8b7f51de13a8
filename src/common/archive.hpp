#ifndef LATTICE_COMMON_ARCHIVE_HPP
#define LATTICE_COMMON_ARCHIVE_HPP

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "config.hpp"
#include "error.hpp"

namespace Lattice::Common::Archive {
    inline constexpr const char* kFormatVersion = "1";

    // In-memory image of an archive: string attributes, named tensors and child groups, each kept in insertion order.
    struct Group {
        std::vector<std::pair<std::string, std::string>> attributes{};
        std::vector<std::pair<std::string, torch::Tensor>> datasets{};
        std::vector<std::pair<std::string, Group>> groups{};

        void set_attribute(const std::string& name, std::string value)
        {
            for (auto& [key, current] : attributes) {
                if (key == name) {
                    current = std::move(value);
                    return;
                }
            }
            attributes.emplace_back(name, std::move(value));
        }

        [[nodiscard]] std::optional<std::string> attribute(const std::string& name) const
        {
            for (const auto& [key, value] : attributes) {
                if (key == name) {
                    return value;
                }
            }
            return std::nullopt;
        }

        void add_dataset(const std::string& name, torch::Tensor value)
        {
            if (dataset(name) != nullptr) {
                throw ValidationError("Dataset '" + name + "' already exists in this group.");
            }
            datasets.emplace_back(name, value.detach().to(torch::kCPU).contiguous());
        }

        [[nodiscard]] const torch::Tensor* dataset(const std::string& name) const
        {
            for (const auto& [key, value] : datasets) {
                if (key == name) {
                    return &value;
                }
            }
            return nullptr;
        }

        Group& create_group(const std::string& name)
        {
            if (group(name) != nullptr) {
                throw ValidationError("Group '" + name + "' already exists in this group.");
            }
            groups.emplace_back(name, Group{});
            return groups.back().second;
        }

        [[nodiscard]] const Group* group(const std::string& name) const
        {
            for (const auto& [key, child] : groups) {
                if (key == name) {
                    return &child;
                }
            }
            return nullptr;
        }
    };

    // Ordered name lists (layer names, weight names) travel as a JSON attribute.
    inline std::string encode_names(const std::vector<std::string>& names)
    {
        PropertyTree tree;
        tree.add_child("names", Config::write_array(names));
        return Config::to_json(tree);
    }

    inline std::vector<std::string> decode_names(const std::string& text, const std::string& context)
    {
        const auto tree = Config::from_json(text, context);
        return Config::read_array<std::string>(tree.get_child("names", PropertyTree{}), context);
    }

    // Default answer source for an overwrite: a [y/N] prompt on the console.
    inline bool confirm_overwrite_on_console(const std::filesystem::path& path)
    {
        std::cout << "\a[WARNING] '" << path.string() << "' already exists. Overwrite? [y/N]: ";
        std::string response;
        std::getline(std::cin, response);
        const bool accepted = !response.empty() && (response[0] == 'y' || response[0] == 'Y');
        if (accepted) {
            std::cout << "[TIP] Next time specify overwrite=true!" << std::endl;
        }
        return accepted;
    }

    // File codec for Group images. `available()` reports whether the codec can be used in this process.
    class Backend {
    public:
        virtual ~Backend() = default;
        [[nodiscard]] virtual bool available() const noexcept = 0;
        [[nodiscard]] virtual std::string tag() const = 0;
        virtual void write(const std::filesystem::path& path, const Group& root) const = 0;
        [[nodiscard]] virtual Group read(const std::filesystem::path& path) const = 0;
    };

    namespace Details {
        // Archive keys are positional; the original names travel in a JSON index next to them.
        inline void write_group(torch::serialize::OutputArchive& archive, const Group& group)
        {
            PropertyTree index;
            PropertyTree attribute_names;
            PropertyTree dataset_names;
            PropertyTree group_names;
            for (std::size_t i = 0; i < group.attributes.size(); ++i) {
                PropertyTree name;
                name.put_value(group.attributes[i].first);
                Config::push_back(attribute_names, std::move(name));
                archive.write("a" + std::to_string(i), c10::IValue(group.attributes[i].second));
            }
            for (std::size_t i = 0; i < group.datasets.size(); ++i) {
                PropertyTree name;
                name.put_value(group.datasets[i].first);
                Config::push_back(dataset_names, std::move(name));
                archive.write("d" + std::to_string(i), group.datasets[i].second, /*is_buffer=*/true);
            }
            for (std::size_t i = 0; i < group.groups.size(); ++i) {
                PropertyTree name;
                name.put_value(group.groups[i].first);
                Config::push_back(group_names, std::move(name));
                torch::serialize::OutputArchive child;
                write_group(child, group.groups[i].second);
                archive.write("g" + std::to_string(i), child);
            }
            index.add_child("attributes", attribute_names);
            index.add_child("datasets", dataset_names);
            index.add_child("groups", group_names);
            archive.write("_index", c10::IValue(Config::to_json(index)));
        }

        inline Group read_group(torch::serialize::InputArchive& archive, const std::string& context)
        {
            c10::IValue index_value;
            if (!archive.try_read("_index", index_value) || !index_value.isString()) {
                throw ValidationError("Archive group '" + context + "' has no readable index.");
            }
            const auto index = Config::from_json(index_value.toStringRef(), "archive index of '" + context + "'");

            Group group;
            std::size_t position = 0;
            for (const auto& entry : index.get_child("attributes", PropertyTree{})) {
                c10::IValue value;
                const auto key = "a" + std::to_string(position++);
                if (!archive.try_read(key, value) || !value.isString()) {
                    throw ValidationError("Archive group '" + context + "' is missing attribute '" + entry.second.data() + "'.");
                }
                group.attributes.emplace_back(entry.second.data(), value.toStringRef());
            }
            position = 0;
            for (const auto& entry : index.get_child("datasets", PropertyTree{})) {
                torch::Tensor value;
                const auto key = "d" + std::to_string(position++);
                if (!archive.try_read(key, value, /*is_buffer=*/true)) {
                    throw ValidationError("Archive group '" + context + "' is missing dataset '" + entry.second.data() + "'.");
                }
                group.datasets.emplace_back(entry.second.data(), value);
            }
            position = 0;
            for (const auto& entry : index.get_child("groups", PropertyTree{})) {
                torch::serialize::InputArchive child;
                const auto key = "g" + std::to_string(position++);
                if (!archive.try_read(key, child)) {
                    throw ValidationError("Archive group '" + context + "' is missing group '" + entry.second.data() + "'.");
                }
                group.groups.emplace_back(entry.second.data(), read_group(child, context + "/" + entry.second.data()));
            }
            return group;
        }
    }

    // libtorch's own serialization (zip container holding a TorchScript module).
    class TorchBackend : public Backend {
    public:
        [[nodiscard]] bool available() const noexcept override { return true; }
        [[nodiscard]] std::string tag() const override { return "torch"; }

        void write(const std::filesystem::path& path, const Group& root) const override
        {
            torch::serialize::OutputArchive archive;
            Details::write_group(archive, root);
            try {
                archive.save_to(path.string());
            } catch (const c10::Error& error) {
                throw SerializationError("Failed to write archive '" + path.string() + "': " + error.what());
            }
        }

        [[nodiscard]] Group read(const std::filesystem::path& path) const override
        {
            if (!std::filesystem::exists(path)) {
                throw ValidationError("Archive not found at '" + path.string() + "'.");
            }
            torch::serialize::InputArchive archive;
            try {
                archive.load_from(path.string());
                return Details::read_group(archive, path.filename().string());
            } catch (const c10::Error& error) {
                throw ValidationError("Failed to read archive '" + path.string() + "': " + error.what());
            }
        }
    };

    inline std::shared_ptr<const Backend> default_backend()
    {
        static const std::shared_ptr<const Backend> backend = std::make_shared<TorchBackend>();
        return backend;
    }

    inline std::shared_ptr<const Backend> require_backend(const std::shared_ptr<const Backend>& backend, const std::string& operation)
    {
        if (!backend || !backend->available()) {
            throw DependencyError("`" + operation + "` requires an archive backend, and none is available.");
        }
        return backend;
    }
}

#endif // LATTICE_COMMON_ARCHIVE_HPP
