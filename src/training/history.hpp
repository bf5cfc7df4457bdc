#ifndef NABLA_TRAINING_HISTORY_HPP
#define NABLA_TRAINING_HISTORY_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace Nabla::Training {

    // Per-epoch series recorded by Model::fit: "loss", one entry per metric
    // name, and their "val_" counterparts, which are only filled when
    // validation data is present.
    class History {
    public:
        using Series = std::vector<double>;

        void add_series(const std::string& name) { series_.try_emplace(name); }

        void append(const std::string& name, double value) { series_[name].push_back(value); }

        [[nodiscard]] bool contains(const std::string& name) const { return series_.count(name) > 0; }

        [[nodiscard]] const Series& at(const std::string& name) const
        {
            const auto it = series_.find(name);
            if (it == series_.end()) {
                throw std::out_of_range("History has no series named '" + name + "'.");
            }
            return it->second;
        }

        [[nodiscard]] const Series& operator[](const std::string& name) const { return at(name); }

        [[nodiscard]] std::size_t size() const noexcept { return series_.size(); }
        [[nodiscard]] bool empty() const noexcept { return series_.empty(); }

        [[nodiscard]] auto begin() const noexcept { return series_.begin(); }
        [[nodiscard]] auto end() const noexcept { return series_.end(); }

    private:
        std::map<std::string, Series> series_{};
    };
}

#endif // NABLA_TRAINING_HISTORY_HPP
