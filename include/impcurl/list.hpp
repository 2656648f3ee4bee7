/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file list.hpp
 * @brief Owning wrapper around curl_slist
 * \see https://github.com/curl/curl/blob/master/lib/slist.c for more informations
 *
 * A native linked list of strings, used to setup transfers options with list type value
 * (e.g. the request headers, \see https://curl.se/libcurl/c/CURLOPT_HTTPHEADER.html).
 * Nodes are allocated and freed through the impcurl::engine the list was created with.
 * @author impcurl contributors
 */

#ifndef INCLUDE_IMPCURL_LIST_H
#define INCLUDE_IMPCURL_LIST_H

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <string>
#include <vector>

struct curl_slist;

namespace impcurl
{
class engine;

/*********************************************************************************************************************/
class list
{
private:
    engine*     engine__{ nullptr };
    curl_slist* head__{ nullptr };
    curl_slist* tail__{ nullptr };

    curl_slist* make_node(const std::string& str);

public:
    class iterator
    {
        friend class list;

    private:
        curl_slist* cur__{ nullptr };

    public:
        using iterator_category = std::forward_iterator_tag;
        using difference_type   = std::ptrdiff_t;
        using value_type        = char*;
        using pointer           = value_type*;
        using reference         = value_type&;

        explicit iterator(curl_slist* elm = nullptr) noexcept
          : cur__{ elm }
        {}

        reference operator*() const noexcept;
        pointer   operator->() const noexcept;
        iterator& operator++() noexcept;
        iterator  operator++(int) noexcept;

        friend bool operator==(const iterator& lhs, const iterator& rhs) noexcept { return lhs.cur__ == rhs.cur__; }
        friend bool operator!=(const iterator& lhs, const iterator& rhs) noexcept { return lhs.cur__ != rhs.cur__; }
    };

    // Constructors
    explicit list(engine& eng) noexcept;
    list(engine& eng, const std::vector<std::string>& values);
    list(engine& eng, std::initializer_list<std::string> values);
    list(const list& o);
    list& operator=(const list& o);
    list(list&& o) noexcept;
    list& operator=(list&& o) noexcept;
    ~list() noexcept;

    // Insertion / Deletion
    iterator push_back(const std::string& str);
    iterator push_front(const std::string& str);
    iterator insert(size_t idx, const std::string& str);
    iterator insert_after(iterator pos, const std::string& str);
    void     remove(size_t idx) noexcept;
    void     clear() noexcept;

    iterator index(size_t idx) const noexcept;
    size_t   size() const noexcept;
    bool     empty() const noexcept { return nullptr == head__; }
    iterator begin() const noexcept { return iterator{ head__ }; }
    iterator end() const noexcept { return iterator{ nullptr }; }

    std::vector<std::string> to_vector() const;

    // Access to raw wrapped list
    curl_slist*               raw() const noexcept { return head__; }
    [[nodiscard]] curl_slist* release() noexcept;
};

} // namespace impcurl

#endif // INCLUDE_IMPCURL_LIST_H
