#pragma once

#include <array>
#include <string>

namespace sysscope {

// Report slots in display and export order.
enum class Slot {
    Summary,
    AllComponents,
    Cpu,
    Memory,
    Gpu,
    Storage,
    Motherboard,
    Network,
    Os,
};

inline constexpr std::array<Slot, 9> kAllSlots = {
    Slot::Summary,
    Slot::AllComponents,
    Slot::Cpu,
    Slot::Memory,
    Slot::Gpu,
    Slot::Storage,
    Slot::Motherboard,
    Slot::Network,
    Slot::Os,
};

// Tab caption; export section headers use it upper-cased.
std::string slotLabel(Slot slot);

struct SlotText {
    Slot slot;
    std::string text;
};

} // namespace sysscope
