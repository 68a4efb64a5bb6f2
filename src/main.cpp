#include "journal_app.hpp"

int main(int argc, char **argv) {
    return runJournalApplication(argc, argv);
}
