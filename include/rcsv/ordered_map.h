/*
 * Copyright (c) 2026 The RCSV Authors
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/**
 * @file ordered_map.h
 * @brief OrderedMap - insertion-ordered flat map.
 *
 * Stores {key, value} pairs contiguously in a std::vector, in the order the
 * keys were first inserted. Lookups are linear, which is efficient for the
 * handful of keys a map-valued record field typically carries. Map fields
 * declared as OrderedMap produce their dynamic columns in insertion order.
 */

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <utility>
#include <vector>

namespace rcsv {

    template<typename Key, typename T>
    class OrderedMap {
    public:
        using key_type          = Key;
        using mapped_type       = T;
        using value_type        = std::pair<Key, T>;
        using Container         = std::vector<value_type>;
        using iterator          = typename Container::iterator;
        using const_iterator    = typename Container::const_iterator;
        using size_type         = size_t;

    private:
        Container data_;

    public:
        OrderedMap() = default;
        OrderedMap(std::initializer_list<value_type> init) {
            for (const auto& entry : init) {
                insert_or_assign(entry.first, entry.second);
            }
        }

        iterator                begin()                 { return data_.begin(); }
        iterator                end()                   { return data_.end(); }
        const_iterator          begin() const           { return data_.begin(); }
        const_iterator          end() const             { return data_.end(); }
        size_t                  size() const            { return data_.size(); }
        bool                    empty() const           { return data_.empty(); }
        void                    clear()                 { data_.clear(); }

        iterator find(const Key& key) {
            return std::find_if(data_.begin(), data_.end(), [&key](const value_type& e) { return e.first == key; });
        }

        const_iterator find(const Key& key) const {
            return std::find_if(data_.begin(), data_.end(), [&key](const value_type& e) { return e.first == key; });
        }

        bool contains(const Key& key) const     { return find(key) != end(); }

        T& at(const Key& key) {
            auto it = find(key);
            if (it == end()) {
                throw std::out_of_range("OrderedMap::at: key not found");
            }
            return it->second;
        }

        const T& at(const Key& key) const {
            auto it = find(key);
            if (it == end()) {
                throw std::out_of_range("OrderedMap::at: key not found");
            }
            return it->second;
        }

        T& operator[](const Key& key) {
            auto it = find(key);
            if (it != end()) {
                return it->second;
            }
            data_.emplace_back(key, T{});
            return data_.back().second;
        }

        /// Insert a new key at the end, or overwrite the value of an existing key in place
        template<typename V>
        std::pair<iterator, bool> insert_or_assign(const Key& key, V&& value) {
            auto it = find(key);
            if (it != end()) {
                it->second = std::forward<V>(value);
                return {it, false};
            }
            data_.emplace_back(key, std::forward<V>(value));
            return {std::prev(data_.end()), true};
        }

        size_t erase(const Key& key) {
            auto it = find(key);
            if (it == end()) {
                return 0;
            }
            data_.erase(it);
            return 1;
        }

        bool operator==(const OrderedMap& other) const = default;
    };

} // namespace rcsv
