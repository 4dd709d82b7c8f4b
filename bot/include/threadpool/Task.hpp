// Task.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <cstddef>

struct Task {
    std::size_t id{};
    std::int64_t chatId{};
    std::string kind;           // "edit", ... chỉ để log

    std::function<void()> fn;

    Task() = default;

    Task(std::size_t id_, std::int64_t chatId_, std::string kind_, std::function<void()> fn_)
        : id(id_),
          chatId(chatId_),
          kind(std::move(kind_)),
          fn(std::move(fn_)) {}
};
