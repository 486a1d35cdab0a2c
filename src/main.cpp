#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "event_emitter/EventEmitter.hpp"

using namespace NEventEmitter;

// --- Демонстрация ---

void demoArguments(TEventEmitter& Emitter) {
    std::cout << "\n--- Demo 1: Arguments ---\n";

    Emitter.DefineEvent("player.login");
    Emitter.AddListener("player.login", [](const TArgs& Args) {
        std::cout << "Player " << std::get<std::string>(Args.at(0))
                  << " logged in with id " << std::get<std::int64_t>(Args.at(1)) << "\n";
    });

    Emitter.Emit("player.login", "Nagibator2000", 1);
}

void demoPatterns(TEventEmitter& Emitter) {
    std::cout << "\n--- Demo 2: Patterns ---\n";

    // Шаблон видит только уже определённые события
    Emitter.DefineEvents({"input.key", "input.mouse", "physics.tick"});

    TListener InputLogger([](TEventEmitter&, const TArgs&) {
        std::cout << "[input] something happened\n";
    });
    Emitter.AddListener(TPattern("^input\\."), InputLogger);

    std::cout << "Emitting every input.* event...\n";
    Emitter.Emit(TPattern("^input\\."));

    Emitter.RemoveListener(TPattern("^input\\."), InputLogger);
    std::cout << "Emitting again (Should be silent).\n";
    Emitter.Emit(TPattern("^input\\."));
}

void demoOnce(TEventEmitter& Emitter) {
    std::cout << "\n--- Demo 3: Once and Sentinel ---\n";

    Emitter.AddOnceListener("physics.tick", []() {
        std::cout << "This runs only ONCE (Initialization)\n";
    });

    int Ticks = 0;
    Emitter.AddListener("physics.tick", [&Ticks]() {
        ++Ticks;
        std::cout << "Tick handler #" << Ticks << "\n";
        // true снимает слушателя после третьего тика
        return Ticks == 3;
    });

    for (int i = 1; i <= 4; ++i) {
        std::cout << "Tick " << i << ":\n";
        Emitter.Emit("physics.tick", 0.016);
    }
}

void demoScoped(TEventEmitter& Emitter) {
    std::cout << "\n--- Demo 4: RAII TScopedListener ---\n";

    {
        TListener Greeter([](const TArgs&) {
            std::cout << "Hello from scoped listener\n";
        });
        Emitter.AddListener("greet", Greeter);
        TScopedListener Guard(Emitter, std::string("greet"), Greeter);

        Emitter.Emit("greet");
        std::cout << "Leaving scope.\n";
    }

    std::cout << "Emitting again (Should be silent).\n";
    Emitter.Emit("greet");
}

void demoBulk(TEventEmitter& Emitter) {
    std::cout << "\n--- Demo 5: Bulk manipulation ---\n";

    TListener Save([]() {
        std::cout << "save\n";
    });
    TListener Quit([]() {
        std::cout << "quit\n";
    });

    Emitter.AddListeners(TEventMap{
        {"menu.save", TListenerArg(Save)},
        {"menu.quit", std::vector<TListenerArg>{Save, Quit}},
    });
    Emitter.Emit(TPattern("^menu\\."));

    Emitter.RemoveListeners(TPattern("^menu\\."), {Save, Quit});
    std::cout << "Listeners left on menu.quit: " << Emitter.GetListenerCount("menu.quit") << "\n";
}

void demoFault(TEventEmitter& Emitter) {
    std::cout << "\n--- Demo 6: Listener fault ---\n";

    Emitter.AddListener("fault", []() {
        throw std::runtime_error("listener failed");
    });
    Emitter.AddListener("fault", []() {
        std::cout << "Never reached\n";
    });

    try {
        Emitter.Emit("fault");
    } catch (const std::runtime_error& e) {
        std::cout << "Caught: " << e.what() << "\n";
    }
}

int main() {
    spdlog::set_level(spdlog::level::debug);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    TEventEmitter Emitter;

    demoArguments(Emitter);
    demoPatterns(Emitter);
    demoOnce(Emitter);
    demoScoped(Emitter);
    demoBulk(Emitter);
    demoFault(Emitter);

    Emitter.RemoveEvent();
    std::cout << "\nAll demos finished successfully!\n";
    return 0;
}
