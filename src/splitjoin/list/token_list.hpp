#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace splitjoin::list {

/**
 * singly linked, append-ordered sequence of string tokens.
 *
 * invariants:
 * - tokens iterate in insertion order; `remove` never reorders survivors.
 * - `tail_` points at the last node, or is null iff the list is empty.
 * - `size_` equals the number of reachable nodes.
 *
 * the list is the single owner of its nodes and is move-only.
 */
class token_list {
  struct node {
    std::string value;
    std::unique_ptr<node> next;
  };

 public:
  class const_iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::string;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::string *;
    using reference = const std::string &;

    const_iterator() noexcept = default;

    reference operator*() const noexcept { return current_->value; }
    pointer operator->() const noexcept { return &current_->value; }

    const_iterator & operator++() noexcept {
      current_ = current_->next.get();
      return *this;
    }

    const_iterator operator++(int) noexcept {
      const_iterator prev = *this;
      ++(*this);
      return prev;
    }

    bool operator==(const const_iterator & other) const noexcept {
      return current_ == other.current_;
    }
    bool operator!=(const const_iterator & other) const noexcept {
      return current_ != other.current_;
    }

   private:
    friend class token_list;
    explicit const_iterator(const node * current) noexcept : current_(current) {}

    const node * current_ = nullptr;
  };

  token_list() = default;
  ~token_list() { clear(); }

  token_list(const token_list &) = delete;
  token_list & operator=(const token_list &) = delete;

  token_list(token_list && other) noexcept
      : head_(std::move(other.head_)),
        tail_(std::exchange(other.tail_, nullptr)),
        size_(std::exchange(other.size_, 0)) {}

  token_list & operator=(token_list && other) noexcept {
    if (this == &other) {
      return *this;
    }
    clear();
    head_ = std::move(other.head_);
    tail_ = std::exchange(other.tail_, nullptr);
    size_ = std::exchange(other.size_, 0);
    return *this;
  }

  void add(std::string value) {
    auto fresh = std::make_unique<node>();
    fresh->value = std::move(value);
    node * raw = fresh.get();
    if (tail_ == nullptr) {
      head_ = std::move(fresh);
    } else {
      tail_->next = std::move(fresh);
    }
    tail_ = raw;
    size_ += 1;
  }

  void add(const std::string_view value) { add(std::string(value)); }
  void add(const char * value) { add(std::string_view(value)); }

  // Unlinks the first token equal to `value`.
  bool remove(const std::string_view value) noexcept {
    node * prev = nullptr;
    std::unique_ptr<node> * link = &head_;
    while (*link != nullptr) {
      node * cur = link->get();
      if (cur->value == value) {
        if (cur == tail_) {
          tail_ = prev;
        }
        std::unique_ptr<node> doomed = std::move(*link);
        *link = std::move(doomed->next);
        size_ -= 1;
        return true;
      }
      prev = cur;
      link = &cur->next;
    }
    return false;
  }

  const std::string * get(const size_t index) const noexcept {
    if (index >= size_) {
      return nullptr;
    }
    const node * cur = head_.get();
    for (size_t i = 0; i < index; ++i) {
      cur = cur->next.get();
    }
    return &cur->value;
  }

  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }

  // Iterative teardown; the default unique_ptr chain would recurse once per node.
  void clear() noexcept {
    std::unique_ptr<node> cur = std::move(head_);
    while (cur != nullptr) {
      cur = std::move(cur->next);
    }
    tail_ = nullptr;
    size_ = 0;
  }

  const_iterator begin() const noexcept { return const_iterator{head_.get()}; }
  const_iterator end() const noexcept { return const_iterator{}; }

 private:
  std::unique_ptr<node> head_ = nullptr;
  node * tail_ = nullptr;
  size_t size_ = 0;
};

}  // namespace splitjoin::list
