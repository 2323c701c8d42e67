/**
 * Registry of the live connections of a broadcast server.
 *
 *        File: ListenerSet.cpp
 *
 *    Copyright 2023 University Corporation for Atmospheric Research
 *
 * Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
 * in compliance with the License. You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software distributed under the License
 * is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
 * or implied. See the License for the specific language governing permissions and limitations under
 * the License.
 */

#include "error.h"
#include "ListenerSet.h"
#include "logging.h"

#include <list>
#include <queue>
#include <unordered_map>

namespace sockcast {

/// Implementation of a set of connections
class ListenerSet::Impl final
{
    class Entry;

    /**
     * Lets a close hook reach this instance without keeping it alive. Only the owners of this
     * instance can therefore destroy it, never a reader thread.
     */
    struct Anchor
    {
        Mutex mutex;
        Impl* impl;

        explicit Anchor(Impl* impl)
            : mutex()
            , impl(impl)
        {}
    };

    using EntryPtr = std::shared_ptr<Entry>;

    /// A connection and its reader thread
    class Entry
    {
    public:
        Connection conn;
        Thread     thread;

        explicit Entry(const Connection& conn)
            : conn(conn)
            , thread()
        {}

        Entry(const Entry& entry) =delete;
        Entry& operator=(const Entry& rhs) =delete;

        ~Entry() noexcept
        {
            try {
                conn.close(); // Idempotent
            }
            catch (const std::exception& ex) {
                LOG_ERROR(ex, "Couldn't close connection %s", conn.to_string().data());
            }

            if (thread.joinable()) {
                if (thread.get_id() == std::this_thread::get_id()) {
                    thread.detach(); // Reader loop is returning
                }
                else {
                    thread.join();
                }
            }
        }
    };

    mutable Mutex                               mutex;
    mutable Cond                                cond;
    bool                                        done;
    bool                                        reaping;
    std::unordered_map<Connection, EntryPtr>    active;
    std::queue<EntryPtr, std::list<EntryPtr>>   inactive;
    std::shared_ptr<Anchor>                     anchor;
    Thread                                      reaper;

    /**
     * Joins the reader threads of removed connections until `done` is set and no removed
     * connections remain. Executed on its own thread.
     */
    void joinReaders() {
        Lock lock{mutex};

        for (;;) {
            cond.wait(lock, [&]{return done || !inactive.empty();});

            if (inactive.empty())
                break; // `done` must be true

            auto entryPtr = inactive.front();
            inactive.pop();

            reaping = true;
            lock.unlock();
            entryPtr.reset(); // Entry's destructor joins the reader thread
            lock.lock();
            reaping = false;
            cond.notify_all();
        }
    }

public:
    Impl()
        : mutex()
        , cond()
        , done{false}
        , reaping{false}
        , active()
        , inactive()
        , anchor(std::make_shared<Anchor>(this))
        , reaper()
    {}

    /// Starts the thread that joins reader threads
    void start() {
        reaper = Thread(&Impl::joinReaders, this);
    }

    ~Impl() noexcept {
        {
            Guard guard{anchor->mutex};
            anchor->impl = nullptr; // Close hooks no longer reach this instance
        }

        std::vector<EntryPtr> entries;
        {
            Guard guard{mutex};
            for (auto& pair : active)
                entries.push_back(pair.second);
            active.clear();
        }

        entries.clear(); // Closes the connections and joins their reader threads

        {
            Guard guard{mutex};
            done = true;
            cond.notify_all();
        }

        if (reaper.joinable())
            reaper.join();
    }

    bool insert(const Connection& conn) {
        {
            Guard guard{mutex};
            if (!conn.isOpen() || active.count(conn))
                return false;
            active.emplace(conn, EntryPtr(new Entry(conn)));
        }

        auto       anchor = this->anchor;
        const bool hookSet = conn.setCloseHook([anchor](const Connection& closed) {
            Guard guard{anchor->mutex};
            if (anchor->impl)
                anchor->impl->erase(closed);
        });

        if (!hookSet) {
            // Closed before the hook could be set
            erase(conn);
            return false;
        }

        return true;
    }

    bool activate(const Connection& conn) {
        Guard guard{mutex};
        auto  iter = active.find(conn);

        if (iter == active.end() || iter->second->thread.joinable())
            return false;

        iter->second->thread = Thread(conn); // Executes the reader loop
        return true;
    }

    bool erase(const Connection& conn) {
        Guard guard{mutex};
        auto  iter = active.find(conn);

        if (iter == active.end())
            return false;

        inactive.push(iter->second);
        active.erase(iter);
        cond.notify_all();

        return true;
    }

    Snapshot snapshot() const {
        Guard    guard{mutex};
        Snapshot snap;

        snap.reserve(active.size());
        for (auto& pair : active)
            snap.push_back(pair.first);

        return snap;
    }

    size_t size() const {
        Guard guard{mutex};
        return active.size();
    }

    void awaitEmpty() {
        Lock lock{mutex};
        cond.wait(lock, [&]{return active.empty() && inactive.empty() && !reaping;});
    }

    void closeAll() {
        for (auto& conn : snapshot()) {
            try {
                conn.close();
            }
            catch (const std::exception& ex) {
                LOG_ERROR(ex, "Couldn't close connection %s", conn.to_string().data());
            }
            erase(conn); // The connection might be closing on another thread
        }
    }
};

/******************************************************************************/

ListenerSet::ListenerSet()
    : pImpl(std::make_shared<Impl>())
{
    pImpl->start();
}

bool ListenerSet::insert(const Connection& conn) const {
    return pImpl->insert(conn);
}

bool ListenerSet::activate(const Connection& conn) const {
    return pImpl->activate(conn);
}

bool ListenerSet::erase(const Connection& conn) const {
    return pImpl->erase(conn);
}

ListenerSet::Snapshot ListenerSet::snapshot() const {
    return pImpl->snapshot();
}

size_t ListenerSet::size() const {
    return pImpl->size();
}

void ListenerSet::closeAll() const {
    pImpl->closeAll();
}

void ListenerSet::awaitEmpty() const {
    pImpl->awaitEmpty();
}

} // namespace
