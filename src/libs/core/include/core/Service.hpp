/*
 * Copyright (C) 2025 TRS contributors
 *
 * This file is part of TRS.
 *
 * TRS is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * TRS is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with TRS.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <atomic>
#include <cassert>
#include <memory>

namespace trs::core
{
    // Registers a process wide instance of an interface for the lifetime of the scope that owns it
    // Tag distinguishes several registrations of the same interface
    template<typename Class, typename Tag = Class>
    class Service
    {
    public:
        Service() = default;
        explicit Service(std::unique_ptr<Class> instance)
        {
            assign(std::move(instance));
        }

        ~Service()
        {
            if (_owned)
                _instance.store(nullptr, std::memory_order_release);
        }

        Service(const Service&) = delete;
        Service(Service&&) = delete;
        Service& operator=(const Service&) = delete;
        Service& operator=(Service&&) = delete;

        Class* operator->() const { return get(); }
        Class& operator*() const { return *get(); }

        // lock free, may be called from any thread
        static Class* get() { return _instance.load(std::memory_order_acquire); }
        static bool exists() { return get() != nullptr; }

        Class& assign(std::unique_ptr<Class> instance)
        {
            assert(instance);
            assert(!exists());

            _owned = std::move(instance);
            _instance.store(_owned.get(), std::memory_order_release);
            return *_owned;
        }

    private:
        std::unique_ptr<Class> _owned;
        static inline std::atomic<Class*> _instance{};
    };
} // namespace trs::core
