#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: result.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Алдаа буцааж болох үйлдлүүдийн утга төрөл (exception API хил давахгүй).
*/


#include <string>
#include <utility>

namespace hv
{
    template<typename T>
    struct Result
    {
        bool ok = false;
        T value{};
        std::string error{};

        static Result<T> success(T v)
        {
            return Result<T>{true, std::move(v), {}};
        }

        static Result<T> failure(std::string e)
        {
            return Result<T>{false, T{}, std::move(e)};
        }
    };

    // Утгагүй Result. Тохиргоо шалгалт зэрэгт хэрэглэнэ.
    struct Status
    {
        bool ok = true;
        std::string error{};

        static Status success()
        {
            return Status{};
        }

        static Status failure(std::string e)
        {
            return Status{false, std::move(e)};
        }
    };
}
