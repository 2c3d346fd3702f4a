#include "sysscope/slots.hpp"

namespace sysscope {

std::string slotLabel(Slot slot) {
    switch (slot) {
    case Slot::Summary:
        return "Summary";
    case Slot::AllComponents:
        return "All Components";
    case Slot::Cpu:
        return "CPU";
    case Slot::Memory:
        return "Memory";
    case Slot::Gpu:
        return "GPU";
    case Slot::Storage:
        return "Storage";
    case Slot::Motherboard:
        return "Motherboard";
    case Slot::Network:
        return "Network";
    case Slot::Os:
        return "OS";
    }
    return {};
}

} // namespace sysscope
