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

/**
 * Chat session actors
 *
 * A SessionActor asks an AuthenticatorActor to check its credentials when
 * it starts. Until the answer arrives it is Authenticating and defers any
 * chat text it receives; once authenticated it forwards its deferred text,
 * then everything new, to the ChatRoomActor. A failed check makes it
 * Rejected, which drops incoming text.
 */

#include <cstring>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "behave/Actor.hpp"
#include "behave/HandlerSet.hpp"
#include "behave/StatefulActor.hpp"
#include "behave/act/Manager.hpp"

namespace chat
{
  struct Authenticate : public behave::Message_N<100> {
    std::string user;
    std::string token;
    Authenticate(std::string u, std::string t) : user(std::move(u)), token(std::move(t)) {}
  };

  struct AuthenticationSuccess : public behave::Message_N<101> {
    std::string user;
    explicit AuthenticationSuccess(std::string u) : user(std::move(u)) {}
  };

  struct AuthenticationFailure : public behave::Message_N<102> {
    std::string user;
    std::string reason;
    AuthenticationFailure(std::string u, std::string r) : user(std::move(u)), reason(std::move(r)) {}
  };

  struct IncomingMessage : public behave::Message_N<103> {
    std::string text;
    explicit IncomingMessage(std::string t) : text(std::move(t)) {}
  };

  struct ChatMessage : public behave::Message_N<104> {
    std::string user;
    std::string text;
    ChatMessage(std::string u, std::string t) : user(std::move(u)), text(std::move(t)) {}
  };

  /**
   * AuthenticatorActor - checks user/token pairs
   */
  class AuthenticatorActor : public behave::Actor {
    std::map<std::string, std::string> tokens_;

  public:
    explicit AuthenticatorActor(std::map<std::string, std::string> tokens)
      : tokens_(std::move(tokens))
    {
      strncpy(name, "authenticator", sizeof(name) - 1);
    }

  protected:
    behave::HandlerSet initial_behavior() override {
      return behave::HandlerSet::build("Checking")
          .on(this, &AuthenticatorActor::on_authenticate)
          .done();
    }

  private:
    void on_authenticate(const Authenticate* m) {
      auto it = tokens_.find(m->user);
      if (it != tokens_.end() && it->second == m->token)
        reply(new AuthenticationSuccess(m->user));
      else
        reply(new AuthenticationFailure(m->user, "bad credentials"));
    }
  };

  struct RoomState {
    std::vector<std::pair<std::string, std::string>> messages;
    std::size_t expected = 0;
  };

  /**
   * ChatRoomActor - collects chat lines
   * With expected > 0 it shuts its manager down after that many lines.
   */
  class ChatRoomActor : public behave::StatefulActor<RoomState> {
  public:
    explicit ChatRoomActor(std::size_t expected = 0) {
      strncpy(name, "room", sizeof(name) - 1);
      state.expected = expected;
    }

  protected:
    behave::HandlerSet initial_behavior() override {
      return open(state);
    }

  private:
    behave::HandlerSet open(RoomState& st) {
      return behave::HandlerSet::build("Open")
          .on<ChatMessage>([this, &st](const ChatMessage* m) {
            std::cout << "[" << m->user << "] " << m->text << std::endl;
            st.messages.emplace_back(m->user, m->text);
            if (st.expected > 0 && st.messages.size() == st.expected && get_manager() != nullptr)
              get_manager()->shutdown();
          })
          .done();
    }
  };

  struct SessionState {
    std::string user;
    std::string token;
    std::vector<std::string> deferred;
    std::size_t forwarded = 0;
    std::size_t dropped = 0;
    std::string failure;
  };

  /**
   * SessionActor - one user's connection to the room
   */
  class SessionActor : public behave::StatefulActor<SessionState> {
    behave::Actor* authenticator_;
    behave::Actor* room_;

  public:
    SessionActor(std::string user, std::string token, behave::Actor* authenticator, behave::Actor* room)
      : authenticator_(authenticator)
      , room_(room)
    {
      strncpy(name, ("session-" + user).c_str(), sizeof(name) - 1);
      state.user = std::move(user);
      state.token = std::move(token);
    }

    behave::HandlerSet authenticating(SessionState& st) {
      return behave::HandlerSet::build("Authenticating")
          .on<AuthenticationSuccess>([this, &st](const AuthenticationSuccess*) {
            become(authenticated(st));
            // deferred text goes out first, in the order it arrived
            for (auto& text : st.deferred)
              forward(st, text);
            st.deferred.clear();
          })
          .on<AuthenticationFailure>([this, &st](const AuthenticationFailure* m) {
            st.failure = m->reason;
            std::cerr << get_name() << ": authentication failed: " << m->reason << std::endl;
            become(rejected(st));
          })
          .on<IncomingMessage>([&st](const IncomingMessage* m) {
            st.deferred.push_back(m->text);
          })
          .done();
    }

    behave::HandlerSet authenticated(SessionState& st) {
      return behave::HandlerSet::build("Authenticated")
          .on<IncomingMessage>([this, &st](const IncomingMessage* m) {
            forward(st, m->text);
          })
          .done();
    }

    behave::HandlerSet rejected(SessionState& st) {
      return behave::HandlerSet::build("Rejected")
          .on<IncomingMessage>([&st](const IncomingMessage*) {
            st.dropped++;
          })
          .done();
    }

  protected:
    behave::HandlerSet initial_behavior() override {
      return authenticating(state);
    }

    void on_start() override {
      if (authenticator_ != nullptr)
        authenticator_->send(new Authenticate(state.user, state.token), this);
    }

  private:
    void forward(SessionState& st, const std::string& text) {
      st.forwarded++;
      if (room_ != nullptr)
        room_->send(new ChatMessage(st.user, text), this);
    }
  };
}
