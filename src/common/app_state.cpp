#include "symiosis/common/app_state.hpp"

namespace symiosis {
namespace common {

AppState& AppState::instance() {
    static AppState instance;
    return instance;
}

}}
