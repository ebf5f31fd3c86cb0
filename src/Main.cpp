#include <csignal>

#include "ControlFlow.hpp"
#include "ConfigGlobal.hpp"

static void OnInterrupt(int)
{
    ControlFlow::RequestInterrupt();
}

int main(int argc, char* argv[])
{
    ConfigGlobal::InitializeDefaults();
    std::signal(SIGINT, OnInterrupt);
#ifdef SIGTERM
    std::signal(SIGTERM, OnInterrupt);
#endif

    ControlFlow App;
    return App.Run(argc, argv);
}
