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

#include <behave/HandlerSet.hpp>

#include "test_actors.hpp"

#include <gtest/gtest.h>

#include <string>
#include <typeindex>
#include <vector>

using namespace behave;
using namespace test;

////////////////////////////////////////////////////////////////////////////////

TEST(handler_set, keeps_declaration_order)
{
    auto set = HandlerSet::build("Ordered")
        .on<Ping>([](const Ping*) {})
        .on_if<Pong>([](const Pong* m) { return m->seq > 0; }, [](const Pong*) {})
        .on<Ping>([](const Ping*) {})
        .done();

    EXPECT_EQ(set.name(), "Ordered");
    ASSERT_EQ(set.size(), 3u);
    EXPECT_EQ(set.registrations()[0].type, std::type_index(typeid(Ping)));
    EXPECT_EQ(set.registrations()[1].type, std::type_index(typeid(Pong)));
    EXPECT_EQ(set.registrations()[2].type, std::type_index(typeid(Ping)));

    EXPECT_FALSE(set.registrations()[0].guard);
    EXPECT_TRUE(set.registrations()[1].guard);
}

TEST(handler_set, built_from_registrations)
{
    int calls = 0;
    std::vector<Registration> regs;
    regs.emplace_back(std::type_index(typeid(Ping)), guard_t(),
                      [&calls](const Message*) { ++calls; });

    HandlerSet set("Manual", regs);

    EXPECT_EQ(set.name(), "Manual");
    EXPECT_EQ(set.size(), 1u);
    EXPECT_TRUE(set.handles<Ping>());
    EXPECT_FALSE(set.handles<Pong>());

    Ping p;
    set.registrations()[0].action(&p);
    EXPECT_EQ(calls, 1);
}

TEST(handler_set, equality_is_identity)
{
    auto make = [] {
        return HandlerSet::build("Same").on<Ping>([](const Ping*) {}).done();
    };

    auto a = make();
    auto copy = a;
    auto b = make();

    EXPECT_TRUE(a == copy);
    EXPECT_FALSE(a == b);
    EXPECT_TRUE(a != b);
    EXPECT_EQ(a.name(), b.name());
}

TEST(handler_set, builder_is_empty_after_done)
{
    auto builder = HandlerSet::build("Once");
    builder.on<Ping>([](const Ping*) {});

    auto first = builder.done();
    auto second = builder.done();

    EXPECT_EQ(first.size(), 1u);
    EXPECT_TRUE(second.empty());
    EXPECT_EQ(second.name(), "");
}

TEST(handler_set, default_is_empty)
{
    HandlerSet set;

    EXPECT_TRUE(set.empty());
    EXPECT_EQ(set.name(), "");
    EXPECT_FALSE(set.handles<Ping>());
}

TEST(handler_set, registration_accepts)
{
    auto set = HandlerSet::build("Guarded")
        .on_if<Ping>([](const Ping* m) { return m->seq % 2 == 0; }, [](const Ping*) {})
        .done();

    const auto& r = set.registrations().front();
    Ping even(2);
    Ping odd(3);
    Pong other(2);

    EXPECT_TRUE(r.accepts(&even));
    EXPECT_FALSE(r.accepts(&odd));
    EXPECT_TRUE(r.matches_type(&odd));
    EXPECT_FALSE(r.matches_type(&other));
}
