#ifndef PLASMA_BACKUP_MESSAGE_QUEUE_HPP_INCLUDED
#define PLASMA_BACKUP_MESSAGE_QUEUE_HPP_INCLUDED
//
// message-queue.hpp
//
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace plasma_backup
{

    // A FIFO queue that one thread pushes into and another pops out of.
    //
    // The queue holds at most capacity messages.  A push() into a full queue blocks until the
    // other side pops something or until close() is called.  So a fast producer can never run
    // ahead of a slow consumer by more than capacity messages.
    //
    // After close() every push() is refused and returns false, but whatever was already queued can
    // still be popped.  Nothing ever blocks on the popping side.
    template <typename Message_t>
    class BoundedMessageQueue
    {
      public:
        explicit BoundedMessageQueue(const std::size_t capacity)
            : m_capacity((capacity == 0) ? 1 : capacity)
            , m_isClosed(false)
            , m_queue()
            , m_mutex()
            , m_notFullCondVar()
        {}

        BoundedMessageQueue(const BoundedMessageQueue &) = delete;
        BoundedMessageQueue & operator=(const BoundedMessageQueue &) = delete;

        std::size_t capacity() const noexcept { return m_capacity; }

        std::size_t size() const
        {
            std::scoped_lock scopedLock(m_mutex);
            return m_queue.size();
        }

        bool isClosed() const
        {
            std::scoped_lock scopedLock(m_mutex);
            return m_isClosed;
        }

        bool push(Message_t message)
        {
            std::unique_lock uniqueLock(m_mutex);

            m_notFullCondVar.wait(
                uniqueLock, [&]() { return (m_isClosed || (m_queue.size() < m_capacity)); });

            if (m_isClosed)
            {
                return false;
            }

            m_queue.push_back(std::move(message));
            return true;
        }

        bool tryPop(Message_t & message)
        {
            {
                std::scoped_lock scopedLock(m_mutex);

                if (m_queue.empty())
                {
                    return false;
                }

                message = std::move(m_queue.front());
                m_queue.pop_front();
            }

            m_notFullCondVar.notify_one();
            return true;
        }

        // pops everything that is waiting, in order
        std::vector<Message_t> drain()
        {
            std::vector<Message_t> messages;

            {
                std::scoped_lock scopedLock(m_mutex);

                messages.reserve(m_queue.size());
                for (Message_t & message : m_queue)
                {
                    messages.push_back(std::move(message));
                }

                m_queue.clear();
            }

            m_notFullCondVar.notify_all();
            return messages;
        }

        void close()
        {
            {
                std::scoped_lock scopedLock(m_mutex);
                m_isClosed = true;
            }

            m_notFullCondVar.notify_all();
        }

        // only for starting over with the same queue once the producer is finished
        void reopen()
        {
            std::scoped_lock scopedLock(m_mutex);
            m_queue.clear();
            m_isClosed = false;
        }

      private:
        const std::size_t m_capacity;
        bool m_isClosed;
        std::deque<Message_t> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_notFullCondVar;
    };

} // namespace plasma_backup

#endif // PLASMA_BACKUP_MESSAGE_QUEUE_HPP_INCLUDED
