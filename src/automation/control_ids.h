#ifndef EXPORTFLOW_CONTROL_IDS_H
#define EXPORTFLOW_CONTROL_IDS_H

namespace exportflow {
namespace controls {

// Main window
constexpr const char* kMainWindow = "wnd[0]";
constexpr const char* kCommandField = "wnd[0]/tbar[0]/okcd";
constexpr const char* kBackButton = "wnd[0]/tbar[0]/btn[3]";
constexpr const char* kExecuteButton = "wnd[0]/tbar[1]/btn[8]";
constexpr int kEnterKey = 0;

// Credential screen
constexpr const char* kLoginUser = "wnd[0]/usr/txtRSYST-BNAME";
constexpr const char* kLoginPassword = "wnd[0]/usr/pwdRSYST-BCODE";
constexpr const char* kLoginClient = "wnd[0]/usr/txtRSYST-MANDT";
constexpr const char* kLoginLanguage = "wnd[0]/usr/txtRSYST-LANGU";

// Record-source report selection screen
constexpr const char* kCategoryField = "wnd[0]/usr/ctxtPC_QMART";
constexpr const char* kDateFromField = "wnd[0]/usr/ctxtSD_QMDAT-LOW";
constexpr const char* kDateToField = "wnd[0]/usr/ctxtSD_QMDAT-HIGH";
constexpr const char* kCodeFilterField = "wnd[0]/usr/ctxtSC_QMCOD-LOW";
constexpr const char* kVariantField = "wnd[0]/usr/ctxtPC_VARIA";
constexpr const char* kRecordSourceExportMenu = "wnd[0]/mbar/menu[0]/menu[4]/menu[1]";

// Bulk-lookup report
constexpr const char* kMultiSelectButton = "wnd[0]/usr/btn%_QMNUM_%_APP_%-VALU_PUSH";
constexpr const char* kDialogPasteButton = "wnd[1]/tbar[0]/btn[24]";
constexpr const char* kDialogExecuteButton = "wnd[1]/tbar[0]/btn[8]";
constexpr const char* kBulkLookupExportMenu = "wnd[0]/mbar/menu[0]/menu[6]";
constexpr const char* kSpreadsheetFormatOption =
    "wnd[1]/usr/subSUBSCREEN_STEPLOOP:SAPLSPO5:0150/sub:SAPLSPO5:0150/radSPOPLI-SELFLAG[0,0]";

// Export dialog
constexpr const char* kDialogOkButton = "wnd[1]/tbar[0]/btn[0]";
constexpr const char* kExportPathField = "wnd[1]/usr/ctxtDY_PATH";
constexpr const char* kExportSaveButton = "wnd[1]/tbar[0]/btn[11]";
constexpr const char* kOverwriteConfirmButton = "wnd[1]/usr/btnSPOP-OPTION1";

} // namespace controls
} // namespace exportflow

#endif // EXPORTFLOW_CONTROL_IDS_H
