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

/**
 * Chat Session Example - switching behavior on authentication
 *
 * Demonstrates:
 * - A start hook that asks another actor for data
 * - Deferring messages until a reply arrives, then become()
 * - Dead letters reported to the manager
 */

#include <iostream>
#include "behave/ActorRef.hpp"
#include "behave/Registry.hpp"
#include "behave/act/Group.hpp"
#include "behave/act/Manager.hpp"
#include "session_actor.hpp"

using namespace behave;
using namespace chat;
using namespace std;

REGISTER_MESSAGE_1(IncomingMessage, text)
REGISTER_MESSAGE_2(ChatMessage, user, text)

class SessionManager : public Manager {
public:
  SessionActor* alice;
  SessionActor* mallory;

  SessionManager() {
    auto* auth = new AuthenticatorActor({{"alice", "s3cret"}, {"bob", "hunter2"}});
    auto* room = new ChatRoomActor(3);

    alice = new SessionActor("alice", "s3cret", auth, room);
    mallory = new SessionActor("mallory", "guess", auth, room);

    ActorConfig dead_letters;
    dead_letters.unhandled = UnhandledPolicy::DeadLetter;
    alice->configure(dead_letters);

    // both sessions share one thread
    auto* sessions = new Group("sessions");
    sessions->add(alice);
    sessions->add(mallory);

    manage(auth);
    manage(room);
    manage(sessions);
  }
};

int main() {
  cout << "=== Chat Session Example ===" << endl;

  SessionManager mgr;
  mgr.init();

  // sent before the authenticator answers: deferred, then forwarded in order
  send(ActorRef(mgr.alice), new IncomingMessage("hello"));
  send(ActorRef(mgr.alice), new IncomingMessage("anyone here?"));
  send(ActorRef(mgr.mallory), new IncomingMessage("let me in"));
  // sessions have no handler for room traffic: reported as a dead letter
  send(ActorRef(mgr.alice), new ChatMessage("eve", "spoofed"));
  send(ActorRef(mgr.alice), new IncomingMessage("bye"));

  // the room stops everything after its third line
  mgr.end();

  cout << "dead letters: " << mgr.dead_letter_count() << endl;
  cout << "=== Chat Session Complete ===" << endl;
  return 0;
}
