#include "order_client_lib.hpp"

int main(int argc, char** argv) {
    order_client::OrderClientApp app;
    return app.run(argc, argv);
}
