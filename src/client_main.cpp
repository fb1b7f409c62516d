#include "loop.hpp"
#include "peer_mesh.hpp"
#include "rtc_media_session.hpp"
#include "websocket_connection.hpp"

#include <rtc/rtc.hpp>

#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>

namespace {

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " <ws-url> host <name> [room-code]" << std::endl;
    std::cerr << "       " << program << " <ws-url> join <room-code> <name>" << std::endl;
}

void PrintHelp() {
    std::cout << "Commands: /start, /stop, /quality <kbps>, /leave, /quit; anything else is chat" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 4) {
        PrintUsage(argv[0]);
        return 2;
    }

    const std::string url = argv[1];
    const std::string mode = argv[2];
    if (mode != "host" && mode != "join") {
        PrintUsage(argv[0]);
        return 2;
    }
    if (mode == "join" && argc < 5) {
        PrintUsage(argv[0]);
        return 2;
    }

    try {
        rtc::InitLogger(rtc::LogLevel::Warning);

        auto loop = std::make_shared<shareflow::Loop>();
        std::thread loopThread([loop] { loop->Run(); });

        auto ws = std::make_shared<rtc::WebSocket>();
        auto connection = std::make_shared<shareflow::WebSocketConnection>(ws);

        shareflow::PeerMesh mesh(
            loop,
            shareflow::MakeRtcSessionFactory(shareflow::MakeRtcConfiguration({"stun:stun.l.google.com:19302"})),
            [connection](const std::string& frame) {
                if (!connection->Send(frame)) {
                    std::cerr << "[Client] Relay connection is not open" << std::endl;
                }
            });

        mesh.OnChat([](const shareflow::ClientId& senderId, const std::string& message) {
            std::cout << "<" << senderId << "> " << message << std::endl;
        });
        mesh.OnLinkState([](const shareflow::ClientId& remoteId, shareflow::MediaSession::State state) {
            std::cout << "[Client] Link " << remoteId << ": " << shareflow::ToString(state) << std::endl;
        });
        mesh.OnRoomClosed([](const std::string& reason) {
            std::cout << "[Client] Room closed: " << reason << std::endl;
        });

        std::promise<void> opened;
        auto openedFuture = opened.get_future();
        bool openedSet = false;

        ws->onOpen([&opened, &openedSet]() {
            std::cout << "[Client] Connected to relay" << std::endl;
            openedSet = true;
            opened.set_value();
        });
        ws->onError([&opened, &openedSet](std::string error) {
            std::cerr << "[Client] WebSocket error: " << error << std::endl;
            if (!openedSet) {
                openedSet = true;
                opened.set_exception(std::make_exception_ptr(std::runtime_error(error)));
            }
        });
        ws->onClosed([]() {
            std::cout << "[Client] Relay connection closed" << std::endl;
        });
        ws->onMessage([loop, &mesh](auto data) {
            if (!std::holds_alternative<std::string>(data)) {
                return;
            }
            loop->EnqueueTask([&mesh, text = std::get<std::string>(std::move(data))] {
                mesh.HandleRelayMessage(text);
            });
        });

        std::cout << "[Client] Connecting to " << url << std::endl;
        try {
            ws->open(url);
            openedFuture.get();
        } catch (const std::exception&) {
            ws->resetCallbacks();
            loop->Stop();
            loopThread.join();
            throw;
        }

        if (mode == "host") {
            std::string roomCode = argc > 4 ? argv[4] : "";
            loop->EnqueueTask([&mesh, name = std::string(argv[3]), roomCode] {
                mesh.CreateRoom(name, roomCode);
            });
        } else {
            loop->EnqueueTask([&mesh, roomCode = std::string(argv[3]), name = std::string(argv[4])] {
                mesh.JoinRoom(roomCode, name);
            });
        }

        PrintHelp();
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty()) {
                continue;
            }

            if (line == "/quit") {
                break;
            }
            else if (line == "/start") {
                loop->EnqueueTask([&mesh] { mesh.StartStreaming(shareflow::VideoSource{}); });
            }
            else if (line == "/stop") {
                loop->EnqueueTask([&mesh] { mesh.StopStreaming(); });
            }
            else if (line.rfind("/quality ", 0) == 0) {
                unsigned kbps = 0;
                try {
                    kbps = static_cast<unsigned>(std::stoul(line.substr(9)));
                } catch (const std::exception&) {
                    std::cerr << "[Client] Bad bitrate: " << line.substr(9) << std::endl;
                    continue;
                }
                loop->EnqueueTask([&mesh, kbps] { mesh.ChangeQuality(kbps); });
            }
            else if (line == "/leave") {
                loop->EnqueueTask([&mesh] { mesh.Leave(); });
            }
            else if (line[0] == '/') {
                PrintHelp();
            }
            else {
                loop->EnqueueTask([&mesh, line] { mesh.SendChat(line); });
            }
        }

        std::promise<void> left;
        loop->EnqueueTask([&mesh, &left] {
            mesh.Leave();
            left.set_value();
        });
        left.get_future().wait();

        loop->Stop();
        loopThread.join();
        ws->resetCallbacks();
        ws->close();
    } catch (const std::exception& e) {
        std::cerr << "[Client] Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
