#pragma once
// USB RX task: reads bytes from USB Serial/JTAG, COBS-decodes frames,
// verifies CRC, applies SET_CONFIG commands and publishes the result to the
// config mailbox. Each command is answered with a CONFIG_ACK packet.

void usb_rx_task(void* arg);
