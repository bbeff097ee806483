/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski,  & M2 Tech
Contact:
v@m2te.ch
mayeski@gmail.com
https://www.linkedin.com/in/vmayeski/
http://m2te.ch/

Permission is hereby granted, free of charge, to any person
obtaining a copy of this software and associated documentation
files (the "Software"), to deal in the Software without
restriction, including without limitation the rights to use,
copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the
Software is furnished to do so, subject to the following
conditions:

The above copyright notice and this permission notice shall be
included in all copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT
HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,
WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR
OTHER DEALINGS IN THE SOFTWARE.

https://opensource.org/licenses/MIT

*/

#pragma once

#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <boost/core/demangle.hpp>
#include <nlohmann/json.hpp>
#include "behave/Message.hpp"

namespace behave::registry
{

using json = nlohmann::json;

/**
 * Serializer function type
 * Converts a message to JSON
 */
using SerializeFn = std::function<json(const Message*)>;

/**
 * Registry entry for a message type
 */
struct RegistryEntry {
    std::string type_name;
    SerializeFn serialize;
};

/**
 * Global message registry singleton
 *
 * Maps message IDs to readable names and JSON serializers. Used when
 * reporting dead letters and faults; registration is optional.
 */
class MessageRegistry {
public:
    static MessageRegistry& instance() {
        static MessageRegistry registry;
        return registry;
    }

    /**
     * Register a message type
     *
     * @param msg_id Message ID (from Message::get_message_id())
     * @param type_name Name used in reports (e.g., "Metric")
     * @param serialize Function to serialize message to JSON
     */
    void register_message(int msg_id,
                          const std::string& type_name,
                          SerializeFn serialize) {
        std::lock_guard<std::mutex> lock(mutex_);
        id_to_entry_[msg_id] = RegistryEntry{type_name, std::move(serialize)};
    }

    /**
     * Get type name for a message ID, empty if not registered
     */
    std::string get_type_name(int msg_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = id_to_entry_.find(msg_id);
        if (it != id_to_entry_.end()) {
            return it->second.type_name;
        }
        return "";
    }

    /**
     * Serialize a message to JSON
     */
    json serialize(const Message* msg) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = id_to_entry_.find(msg->get_message_id());
        if (it != id_to_entry_.end()) {
            return it->second.serialize(msg);
        }
        throw std::runtime_error("Message type not registered: " + std::to_string(msg->get_message_id()));
    }

    bool is_registered(int msg_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return id_to_entry_.find(msg_id) != id_to_entry_.end();
    }

private:
    MessageRegistry() = default;
    mutable std::mutex mutex_;
    std::unordered_map<int, RegistryEntry> id_to_entry_;
};

// Convenience functions
inline void register_message(int msg_id,
                             const std::string& type_name,
                             SerializeFn serialize) {
    MessageRegistry::instance().register_message(msg_id, type_name, std::move(serialize));
}

inline json serialize(const Message* msg) {
    return MessageRegistry::instance().serialize(msg);
}

inline bool is_registered(int msg_id) {
    return MessageRegistry::instance().is_registered(msg_id);
}

/**
 * Name of a message for logs and reports
 * The registered name if there is one, the demangled C++ type otherwise.
 */
inline std::string type_name(const Message* msg) {
    auto name = MessageRegistry::instance().get_type_name(msg->get_message_id());
    if (!name.empty())
        return name;
    return boost::core::demangle(typeid(*msg).name());
}

/**
 * JSON text of a message, or an empty string if its type is not registered
 */
inline std::string payload(const Message* msg) {
    if (!is_registered(msg->get_message_id()))
        return "";
    return serialize(msg).dump();
}

} // namespace behave::registry

/**
 * REGISTER_MESSAGE_1 - Register a message with 1 field
 *
 * Usage:
 *   struct Metric : public Message_N<110> {
 *       double value;
 *       Metric(double v = 0) : value(v) {}
 *   };
 *
 *   REGISTER_MESSAGE_1(Metric, value)
 */
#define REGISTER_MESSAGE_1(Type, field1)                                        \
    namespace {                                                                  \
        static bool Type##_registered_ = []() {                                  \
            behave::registry::register_message(Type::message_id, #Type,          \
                [](const behave::Message* m) -> nlohmann::json {                 \
                    const Type* msg = static_cast<const Type*>(m);               \
                    return nlohmann::json{{#field1, msg->field1}};               \
                });                                                              \
            return true;                                                         \
        }();                                                                     \
    }

/**
 * REGISTER_MESSAGE_2 - Register a message with 2 fields
 */
#define REGISTER_MESSAGE_2(Type, field1, field2)                                \
    namespace {                                                                  \
        static bool Type##_registered_ = []() {                                  \
            behave::registry::register_message(Type::message_id, #Type,          \
                [](const behave::Message* m) -> nlohmann::json {                 \
                    const Type* msg = static_cast<const Type*>(m);               \
                    return nlohmann::json{{#field1, msg->field1}, {#field2, msg->field2}}; \
                });                                                              \
            return true;                                                         \
        }();                                                                     \
    }

/**
 * REGISTER_MESSAGE_3 - Register a message with 3 fields
 */
#define REGISTER_MESSAGE_3(Type, f1, f2, f3)                                    \
    namespace {                                                                  \
        static bool Type##_registered_ = []() {                                  \
            behave::registry::register_message(Type::message_id, #Type,          \
                [](const behave::Message* m) -> nlohmann::json {                 \
                    const Type* msg = static_cast<const Type*>(m);               \
                    return nlohmann::json{{#f1, msg->f1}, {#f2, msg->f2}, {#f3, msg->f3}}; \
                });                                                              \
            return true;                                                         \
        }();                                                                     \
    }

/**
 * REGISTER_MESSAGE_0 - Register a message with no fields
 */
#define REGISTER_MESSAGE_0(Type)                                                \
    namespace {                                                                  \
        static bool Type##_registered_ = []() {                                  \
            behave::registry::register_message(Type::message_id, #Type,          \
                [](const behave::Message*) -> nlohmann::json {                   \
                    return nlohmann::json::object();                             \
                });                                                              \
            return true;                                                         \
        }();                                                                     \
    }
