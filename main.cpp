#include "app/TrialGuardApp.hpp"

int main(int argc, char** argv) {
    trialguard::app::TrialGuardApp app;
    return app.Run(argc, argv);
}
