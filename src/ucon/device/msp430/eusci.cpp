#include <ucon/device/msp430/eusci.hpp>

namespace ucon::dev::msp430 {

#ifdef UCON_DEV_MSP430_ENABLE_EUSCIA0
void __attribute__((interrupt(USCI_A0_VECTOR))) eusci_a0_layer::isr() {
    switch(__even_in_range(UCA0IV,8)) {
    case 0x00: // Vector 0: No interrupts
        break;
    case 0x02: // Vector 2: UCRXIFG
        eusci_a0::handle_rx();
        break;
    case 0x04: // Vector 4: UCTXIFG
        break;
    case 0x06: // Vector 6: UCSTTIFG
        break;
    case 0x08: // Vector 8: UCTXCPTIFG
        eusci_a0::handle_tx_complete();
        break;
    default: break;
    }
    // wakeup kernel loop
    __bic_SR_register_on_exit(LPM0_bits);
}
#endif

#ifdef UCON_DEV_MSP430_ENABLE_EUSCIA1
void __attribute__((interrupt(USCI_A1_VECTOR))) eusci_a1_layer::isr() {
    switch(__even_in_range(UCA1IV,8)) {
    case 0x00: // Vector 0: No interrupts
        break;
    case 0x02: // Vector 2: UCRXIFG
        eusci_a1::handle_rx();
        break;
    case 0x04: // Vector 4: UCTXIFG
        break;
    case 0x06: // Vector 6: UCSTTIFG
        break;
    case 0x08: // Vector 8: UCTXCPTIFG
        eusci_a1::handle_tx_complete();
        break;
    default: break;
    }
    // wakeup kernel loop
    __bic_SR_register_on_exit(LPM0_bits);
}
#endif

}
