/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <impcurl/engine.hpp>
#include <impcurl/list.hpp>

#include <curl/curl.h>

#include <new>
#include <utility>

namespace impcurl
{
//---------------------------------------------------------------------------------------------------------------------
// LIST::ITERATOR FUNCTIONS
//---------------------------------------------------------------------------------------------------------------------

list::iterator::reference
list::iterator::operator*() const noexcept
{
    return cur__->data;
}

list::iterator::pointer
list::iterator::operator->() const noexcept
{
    return &cur__->data;
}

list::iterator&
list::iterator::operator++() noexcept
{
    if (nullptr != cur__) cur__ = cur__->next;
    return *this;
}

list::iterator
list::iterator::operator++(int) noexcept
{
    list::iterator tmp{ *this };
    ++(*this);
    return tmp;
}

//---------------------------------------------------------------------------------------------------------------------
// CONSTRUCTORS/DESTRUCTOR
//---------------------------------------------------------------------------------------------------------------------

list::list(engine& eng) noexcept
  : engine__{ &eng }
{}

list::list(engine& eng, const std::vector<std::string>& values)
  : engine__{ &eng }
{
    for (const auto& v : values)
        push_back(v);
}

list::list(engine& eng, std::initializer_list<std::string> values)
  : engine__{ &eng }
{
    for (const auto& v : values)
        push_back(v);
}

/**
 * @brief list - Deep copy: every node is duplicated through the engine of \a o
 */
list::list(const list& o)
  : engine__{ o.engine__ }
{
    for (const auto* n{ o.head__ }; nullptr != n; n = n->next)
        push_back(n->data);
}

list&
list::operator=(const list& o)
{
    if (this == &o) return *this;

    list tmp{ o };
    *this = std::move(tmp);
    return *this;
}

list::list(list&& o) noexcept
  : engine__{ o.engine__ }
  , head__{ std::exchange(o.head__, nullptr) }
  , tail__{ std::exchange(o.tail__, nullptr) }
{}

list&
list::operator=(list&& o) noexcept
{
    std::swap(engine__, o.engine__);
    head__ = std::exchange(o.head__, head__);
    tail__ = std::exchange(o.tail__, tail__);
    return *this;
}

list::~list() noexcept
{
    clear();
}

//---------------------------------------------------------------------------------------------------------------------
// INSERTION / DELETION
//---------------------------------------------------------------------------------------------------------------------

curl_slist*
list::make_node(const std::string& str)
{
    auto n{ engine__->slist_append(nullptr, str.c_str()) };
    if (nullptr == n) throw std::bad_alloc{};
    return n;
}

list::iterator
list::push_back(const std::string& str)
{
    return insert_after(end(), str);
}

list::iterator
list::push_front(const std::string& str)
{
    auto n{ make_node(str) };

    n->next = head__;
    head__  = n;
    if (nullptr == tail__) tail__ = n;
    return iterator{ n };
}

list::iterator
list::insert(size_t idx, const std::string& str)
{
    if (0 == idx) return push_front(str);
    return insert_after(index(idx - 1), str);
}

/**
 * @brief insert_after - Insert a string after a given position
 * @param pos The position, end() meaning the last element
 * @param str The string to insert (copied)
 * @return The position of the new element
 */
list::iterator
list::insert_after(list::iterator pos, const std::string& str)
{
    auto n{ make_node(str) };

    if (nullptr == pos.cur__) pos.cur__ = tail__;
    if (nullptr != pos.cur__)
    {
        n->next         = pos.cur__->next;
        pos.cur__->next = n;
    }
    else
    {
        n->next = nullptr;
        head__  = n;
    }
    if (nullptr == n->next) tail__ = n;
    return iterator{ n };
}

void
list::remove(size_t idx) noexcept
{
    curl_slist* prev{ nullptr };
    auto        ptr{ head__ };

    for (size_t i{ 0 }; i < idx && nullptr != ptr; ++i)
    {
        prev = ptr;
        ptr  = ptr->next;
    }
    if (nullptr == ptr) return;

    if (nullptr == prev)
        head__ = ptr->next;
    else
        prev->next = ptr->next;
    if (tail__ == ptr) tail__ = prev;

    ptr->next = nullptr;
    engine__->slist_free_all(ptr);
}

void
list::clear() noexcept
{
    if (nullptr != head__) engine__->slist_free_all(head__);
    head__ = nullptr;
    tail__ = nullptr;
}

//---------------------------------------------------------------------------------------------------------------------
// ACCESS
//---------------------------------------------------------------------------------------------------------------------

list::iterator
list::index(size_t idx) const noexcept
{
    auto node{ head__ };
    for (size_t i{ 0 }; ((i != idx) && (nullptr != node)); ++i)
        node = node->next;
    return iterator{ node };
}

size_t
list::size() const noexcept
{
    size_t ret{ 0 };
    for (auto n{ head__ }; nullptr != n; n = n->next)
        ++ret;
    return ret;
}

std::vector<std::string>
list::to_vector() const
{
    std::vector<std::string> ret;
    for (auto it{ begin() }; end() != it; ++it)
        ret.emplace_back(*it);
    return ret;
}

/**
 * @brief release - Give up the ownership of the native list
 * @return The head of the list, that the caller MUST free with curl_slist_free_all
 */
curl_slist*
list::release() noexcept
{
    tail__ = nullptr;
    return std::exchange(head__, nullptr);
}

} // namespace impcurl
